#ifndef SESSION_CONTROLLER_HH
#define SESSION_CONTROLLER_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "abr_algo.hh"
#include "clock.hh"
#include "metric_log.hh"
#include "metrics_recorder.hh"
#include "representation.hh"

struct SessionConfig
{
  double segment_duration_s {2.0};
  uint64_t segment_count {0};  /* segment indices 0 .. segment_count - 1 */
  double timeout_s {30.0};
  size_t throughput_window {MetricsRecorder::THROUGHPUT_WINDOW};
  size_t rtt_window {MetricsRecorder::RTT_WINDOW};
};

/* progress of the segment in flight as reported by a transport */
struct ProgressEvent
{
  uint64_t segment_index {};
  std::string representation_id {};
  uint64_t bytes_so_far {};
  double elapsed_so_far_s {};
  bool is_first_chunk {false};
  bool is_final {false};
};

struct SegmentRequest
{
  uint64_t segment_index {};
  Representation representation {};
};

enum class SegmentOutcome { Completed, TimedOut };

/* emitted once per segment after it completes or times out */
struct Decision
{
  uint64_t segment_index {};       /* the segment that just ended */
  SegmentOutcome outcome {SegmentOutcome::Completed};
  Representation next {};          /* representation for the next request */
  bool switched {false};
};

/* Drives one session: at most one segment in flight, no retries. Transport
 * adapters report progress; the controller records metrics, decides the
 * next representation after each final or timed-out segment and advances. */
class SessionController
{
public:
  enum class State {
    Idle, Requesting, Awaiting, Completed, TimedOut, Deciding, Finished
  };

  SessionController(const std::string & name,
                    const SessionConfig & config,
                    RepresentationLadder ladder,
                    std::unique_ptr<ABRAlgo> && abr_algo,
                    const Clock & clock,
                    std::unique_ptr<MetricSink> && sink);

  /* forbid copying or moving SessionController */
  SessionController(const SessionController & other) = delete;
  SessionController & operator=(const SessionController & other) = delete;

  /* start the next segment; nullopt once the plan is exhausted */
  std::optional<SegmentRequest> next_request();

  /* record a progress event of the segment in flight; returns the decision
   * when the event is final */
  std::optional<Decision> on_progress(const ProgressEvent & event,
                                      const double rtt_sample_s);

  /* time out the segment in flight if its deadline has passed */
  std::optional<Decision> check_timeout(const double rtt_sample_s = 0);

  /* cancel the session; a segment in flight still gets a timeout-shaped
   * record. Returns that record if there was one. */
  std::optional<MetricRecord> abort(const double rtt_sample_s = 0);

  /* summarize, persist the summary and stop; aborts a segment in flight */
  SessionSummary finish(const double rtt_sample_s = 0);

  /* accessors */
  const std::string & name() const { return name_; }
  State state() const { return state_; }
  bool in_flight() const;

  const RepresentationLadder & ladder() const { return ladder_; }
  const Representation & current_representation() const;
  uint64_t next_segment_index() const { return next_segment_index_; }

  std::optional<uint64_t> request_start_ms() const { return request_start_ms_; }
  std::optional<uint64_t> timeout_deadline_ms() const;

  const MetricsRecorder & recorder() const { return recorder_; }
  const ABRAlgo & abr_algo() const { return *abr_algo_; }
  const SessionConfig & config() const { return config_; }

  static std::string state_name(const State state);

private:
  std::string name_;
  SessionConfig config_;
  RepresentationLadder ladder_;
  std::unique_ptr<ABRAlgo> abr_algo_;
  const Clock & clock_;
  MetricsRecorder recorder_;

  State state_ {State::Idle};

  /* sessions start at the lowest representation */
  size_t curr_index_ {0};
  uint64_t next_segment_index_ {0};

  /* segment in flight */
  std::optional<uint64_t> request_start_ms_ {};
  uint64_t bytes_so_far_ {0};
  double elapsed_so_far_s_ {0};

  SegmentObservation observation(const uint64_t byte_count,
                                 const double elapsed_s,
                                 const bool is_final) const;
  Decision decide(const SegmentOutcome outcome);
};

#endif /* SESSION_CONTROLLER_HH */
