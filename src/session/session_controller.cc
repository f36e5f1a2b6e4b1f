#include "session_controller.hh"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "timestamp.hh"

using namespace std;

SessionController::SessionController(const string & name,
                                     const SessionConfig & config,
                                     RepresentationLadder ladder,
                                     unique_ptr<ABRAlgo> && abr_algo,
                                     const Clock & clock,
                                     unique_ptr<MetricSink> && sink)
  : name_(name), config_(config), ladder_(move(ladder)),
    abr_algo_(move(abr_algo)), clock_(clock),
    recorder_(config.segment_duration_s, clock, move(sink),
              config.throughput_window, config.rtt_window)
{
  if (not abr_algo_) {
    throw invalid_argument("SessionController: ABR algorithm is required");
  }

  if (not isfinite(config_.timeout_s) or config_.timeout_s <= 0) {
    throw invalid_argument("SessionController: timeout must be positive");
  }

  /* the deadline is kept in uint64_t milliseconds */
  if (config_.timeout_s * THOUSAND
      >= (double) numeric_limits<uint64_t>::max() / 2) {
    throw invalid_argument("SessionController: timeout is too large");
  }
}

string SessionController::state_name(const State state)
{
  switch (state) {
  case State::Idle: return "idle";
  case State::Requesting: return "requesting";
  case State::Awaiting: return "awaiting";
  case State::Completed: return "completed";
  case State::TimedOut: return "timed_out";
  case State::Deciding: return "deciding";
  case State::Finished: return "finished";
  }

  return "unknown";
}

bool SessionController::in_flight() const
{
  return state_ == State::Requesting or state_ == State::Awaiting;
}

const Representation & SessionController::current_representation() const
{
  return ladder_.at(curr_index_);
}

optional<uint64_t> SessionController::timeout_deadline_ms() const
{
  if (not in_flight()) {
    return nullopt;
  }

  return *request_start_ms_ + (uint64_t) (config_.timeout_s * THOUSAND);
}

optional<SegmentRequest> SessionController::next_request()
{
  if (in_flight()) {
    throw logic_error(name_ + ": segment " + to_string(next_segment_index_)
                      + " is still in flight");
  }

  if (state_ == State::Finished) {
    return nullopt;
  }

  if (next_segment_index_ >= config_.segment_count) {
    state_ = State::Finished;
    return nullopt;
  }

  state_ = State::Requesting;
  request_start_ms_ = clock_.now_ms();
  bytes_so_far_ = 0;
  elapsed_so_far_s_ = 0;

  return SegmentRequest {next_segment_index_, current_representation()};
}

SegmentObservation SessionController::observation(const uint64_t byte_count,
                                                  const double elapsed_s,
                                                  const bool is_final) const
{
  SegmentObservation obs;
  obs.segment_index = next_segment_index_;
  obs.representation_id = current_representation().id;
  obs.byte_count = byte_count;
  obs.elapsed_s = elapsed_s;
  obs.timestamp_ms = clock_.now_ms();
  obs.is_final = is_final;
  return obs;
}

optional<Decision> SessionController::on_progress(const ProgressEvent & event,
                                                  const double rtt_sample_s)
{
  if (not in_flight()) {
    throw invalid_argument(name_ + ": progress for segment "
                           + to_string(event.segment_index)
                           + " while no segment is in flight");
  }

  if (event.segment_index != next_segment_index_) {
    throw invalid_argument(name_ + ": progress for segment "
                           + to_string(event.segment_index)
                           + " but segment " + to_string(next_segment_index_)
                           + " is in flight");
  }

  /* throws for an unknown representation */
  if (ladder_.index_of(event.representation_id) != curr_index_) {
    throw invalid_argument(name_ + ": progress for " + event.representation_id
                           + " but " + current_representation().id
                           + " was requested");
  }

  if (event.elapsed_so_far_s < 0) {
    throw invalid_argument(name_ + ": negative elapsed time "
                           + to_string(event.elapsed_so_far_s));
  }

  /* a rejected observation leaves the segment in flight */
  recorder_.record(observation(event.bytes_so_far, event.elapsed_so_far_s,
                               event.is_final),
                   current_representation(), rtt_sample_s);

  bytes_so_far_ = event.bytes_so_far;
  elapsed_so_far_s_ = event.elapsed_so_far_s;

  if (not event.is_final) {
    state_ = State::Awaiting;
    return nullopt;
  }

  state_ = State::Completed;

  return decide(SegmentOutcome::Completed);
}

optional<Decision> SessionController::check_timeout(const double rtt_sample_s)
{
  if (not in_flight() or clock_.now_ms() < *timeout_deadline_ms()) {
    return nullopt;
  }

  cerr << name_ << ": timeout waiting for segment " << next_segment_index_
       << endl;

  /* progress may have been reported past the deadline */
  const double elapsed_s = max(config_.timeout_s, elapsed_so_far_s_);
  recorder_.record(observation(bytes_so_far_, elapsed_s, false),
                   current_representation(), rtt_sample_s);
  state_ = State::TimedOut;

  return decide(SegmentOutcome::TimedOut);
}

Decision SessionController::decide(const SegmentOutcome outcome)
{
  state_ = State::Deciding;

  const auto & last = recorder_.records().back();
  const ThroughputEstimate tput {last.smoothed_throughput_bps,
                                 last.throughput_bps};

  const size_t next_index = abr_algo_->select_representation(
      ladder_, curr_index_, tput);

  Decision decision;
  decision.segment_index = next_segment_index_;
  decision.outcome = outcome;
  decision.switched = (next_index != curr_index_);
  decision.next = ladder_.at(next_index);

  if (decision.switched) {
    cerr << name_ << ": switching " << current_representation().id << " -> "
         << decision.next.id << endl;
  }

  curr_index_ = next_index;

  /* at most once per segment: a failed segment is not retried */
  next_segment_index_++;
  request_start_ms_.reset();

  return decision;
}

optional<MetricRecord> SessionController::abort(const double rtt_sample_s)
{
  optional<MetricRecord> ret;

  if (in_flight()) {
    const double elapsed_s = max(
        (double) (clock_.now_ms() - *request_start_ms_) / THOUSAND,
        elapsed_so_far_s_);

    cerr << name_ << ": aborted during segment " << next_segment_index_
         << endl;

    ret = recorder_.record(observation(bytes_so_far_, elapsed_s, false),
                           current_representation(), rtt_sample_s);
    state_ = State::TimedOut;

    next_segment_index_++;
    request_start_ms_.reset();
  }

  state_ = State::Finished;
  return ret;
}

SessionSummary SessionController::finish(const double rtt_sample_s)
{
  abort(rtt_sample_s);

  const SessionSummary summary = recorder_.summarize();
  recorder_.finish(summary);

  return summary;
}
