#include "metrics_recorder.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

MetricsRecorder::MetricsRecorder(const double segment_duration_s,
                                 const Clock & clock,
                                 unique_ptr<MetricSink> && sink,
                                 const size_t throughput_window,
                                 const size_t rtt_window)
  : segment_duration_s_(segment_duration_s), buffer_(clock),
    throughput_window_(throughput_window), rtt_window_(rtt_window),
    sink_(move(sink))
{
  if (not isfinite(segment_duration_s_) or segment_duration_s_ <= 0) {
    throw invalid_argument("MetricsRecorder: segment duration must be positive");
  }
}

double MetricsRecorder::buffer_debit(const SegmentObservation & obs)
{
  /* partial observations report cumulative elapsed time, so only the time
   * since the previous observation of the same segment is new */
  if (not debit_segment_ or *debit_segment_ != obs.segment_index) {
    debit_segment_ = obs.segment_index;
    debited_s_ = 0;
  }

  const double debit = obs.elapsed_s - debited_s_;
  if (debit < 0) {
    throw invalid_argument("elapsed time of segment "
                           + to_string(obs.segment_index) + " went backwards");
  }

  debited_s_ = obs.elapsed_s;
  if (obs.is_final) {
    debit_segment_.reset();
  }

  return debit;
}

const MetricRecord & MetricsRecorder::record(const SegmentObservation & obs,
                                             const Representation & repr,
                                             const double rtt_sample_s)
{
  if (obs.elapsed_s < 0 or not isfinite(obs.elapsed_s)) {
    throw invalid_argument("invalid elapsed time " + to_string(obs.elapsed_s));
  }

  if (obs.representation_id != repr.id) {
    throw invalid_argument("observation for " + obs.representation_id
                           + " recorded against " + repr.id);
  }

  if (rtt_sample_s < 0) {
    throw invalid_argument("negative RTT sample " + to_string(rtt_sample_s));
  }

  const double debit = buffer_debit(obs);

  double throughput = 0;
  if (obs.elapsed_s > 0) {
    throughput = obs.byte_count * 8 / obs.elapsed_s;
    throughput_window_.push(throughput);
  }
  const double smoothed_throughput = throughput_window_.mean();

  rtt_window_.push(rtt_sample_s);

  const bool is_rebuffering = buffer_.update(debit, segment_duration_s_,
                                             obs.is_final);

  if (obs.is_final) {
    playback_position_s_ = obs.segment_index * segment_duration_s_;
  }

  bool bitrate_switch = false;
  if (prev_representation_id_ and *prev_representation_id_ != repr.id) {
    bitrate_switch = true;
    bitrate_switches_++;
  }
  prev_representation_id_ = repr.id;

  const double goodput = repr.bitrate_bps > 0 ?
      min(throughput, (double) repr.bitrate_bps) : throughput;

  /* deviation of the latest sample from the window mean */
  double loss_estimate = 0;
  if (throughput_window_.size() > 1 and smoothed_throughput > 0) {
    loss_estimate = min(fabs(throughput - smoothed_throughput)
                        / smoothed_throughput, 1.0);
  }

  MetricRecord rec;
  rec.timestamp_ms = obs.timestamp_ms;
  rec.segment_index = obs.segment_index;
  rec.representation_id = repr.id;
  rec.bitrate_bps = repr.bitrate_bps;
  rec.byte_count = obs.byte_count;
  rec.elapsed_s = obs.elapsed_s;
  rec.throughput_bps = throughput;
  rec.smoothed_throughput_bps = smoothed_throughput;
  rec.rtt_estimate_s = rtt_window_.mean();
  rec.buffer_level_s = buffer_.level_s();
  rec.rebuffer_count = buffer_.rebuffer_count();
  rec.total_rebuffer_s = buffer_.total_rebuffer_s();
  rec.playback_position_s = playback_position_s_;
  rec.is_rebuffering = is_rebuffering;
  rec.bitrate_switch = bitrate_switch;
  rec.goodput_bps = goodput;
  rec.loss_estimate = loss_estimate;
  rec.is_complete = obs.is_final;

  records_.emplace_back(move(rec));

  if (sink_) {
    sink_->append(records_.back());
  }

  return records_.back();
}

SessionSummary MetricsRecorder::summarize() const
{
  SessionSummary summary;

  if (records_.empty()) {
    return summary;
  }

  summary.record_count = records_.size();
  summary.rebuffer_count = buffer_.rebuffer_count();
  summary.total_rebuffer_s = buffer_.total_rebuffer_s();
  summary.bitrate_switches = bitrate_switches_;

  size_t tput_cnt = 0, rtt_cnt = 0;
  double tput_sum = 0, goodput_sum = 0, rtt_sum = 0, buffer_sum = 0;

  summary.min_buffer_s = records_.front().buffer_level_s;
  summary.max_buffer_s = records_.front().buffer_level_s;

  for (size_t i = 0; i < records_.size(); i++) {
    const auto & rec = records_[i];

    /* records of a segment are contiguous; its last one tells the outcome */
    const bool last_of_segment = (i + 1 == records_.size() or
        records_[i + 1].segment_index != rec.segment_index);
    if (last_of_segment) {
      if (rec.is_complete) {
        summary.completed_segments++;
      } else {
        summary.timed_out_segments++;
      }
    }

    if (rec.throughput_bps > 0) {
      if (tput_cnt == 0) {
        summary.min_throughput_bps = rec.throughput_bps;
        summary.max_throughput_bps = rec.throughput_bps;
      } else {
        summary.min_throughput_bps = min(summary.min_throughput_bps,
                                         rec.throughput_bps);
        summary.max_throughput_bps = max(summary.max_throughput_bps,
                                         rec.throughput_bps);
      }
      tput_cnt++;
      tput_sum += rec.throughput_bps;
      goodput_sum += rec.goodput_bps;
    }

    if (rec.rtt_estimate_s > 0) {
      if (rtt_cnt == 0) {
        summary.min_rtt_s = rec.rtt_estimate_s;
        summary.max_rtt_s = rec.rtt_estimate_s;
      } else {
        summary.min_rtt_s = min(summary.min_rtt_s, rec.rtt_estimate_s);
        summary.max_rtt_s = max(summary.max_rtt_s, rec.rtt_estimate_s);
      }
      rtt_cnt++;
      rtt_sum += rec.rtt_estimate_s;
    }

    summary.min_buffer_s = min(summary.min_buffer_s, rec.buffer_level_s);
    summary.max_buffer_s = max(summary.max_buffer_s, rec.buffer_level_s);
    buffer_sum += rec.buffer_level_s;
  }

  if (tput_cnt > 0) {
    summary.mean_throughput_bps = tput_sum / tput_cnt;
    summary.goodput_efficiency = goodput_sum / tput_sum;
  }

  if (rtt_cnt > 0) {
    summary.mean_rtt_s = rtt_sum / rtt_cnt;
  }

  summary.mean_buffer_s = buffer_sum / records_.size();

  return summary;
}

void MetricsRecorder::finish(const SessionSummary & summary)
{
  if (sink_) {
    sink_->finish(summary);
  }
}
