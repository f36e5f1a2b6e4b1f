#ifndef METRICS_RECORDER_HH
#define METRICS_RECORDER_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "clock.hh"
#include "metric_log.hh"
#include "metric_record.hh"
#include "playback_buffer.hh"
#include "representation.hh"
#include "sample_window.hh"

class MetricsRecorder
{
public:
  static constexpr size_t THROUGHPUT_WINDOW = 5;
  static constexpr size_t RTT_WINDOW = 10;

  /* sink may be null, in which case records are only kept in memory */
  MetricsRecorder(const double segment_duration_s,
                  const Clock & clock,
                  std::unique_ptr<MetricSink> && sink,
                  const size_t throughput_window = THROUGHPUT_WINDOW,
                  const size_t rtt_window = RTT_WINDOW);

  /* forbid copying or moving MetricsRecorder (PlaybackBuffer holds the clock) */
  MetricsRecorder(const MetricsRecorder & other) = delete;
  MetricsRecorder & operator=(const MetricsRecorder & other) = delete;

  /* update windows and buffer from one observation, then build, store and
   * persist its record; obs.representation_id must name repr */
  const MetricRecord & record(const SegmentObservation & obs,
                              const Representation & repr,
                              const double rtt_sample_s);

  /* aggregate over all records; all zero if nothing was recorded */
  SessionSummary summarize() const;

  /* hand the summary to the sink */
  void finish(const SessionSummary & summary);

  /* accessors */
  const std::vector<MetricRecord> & records() const { return records_; }
  const PlaybackBuffer & buffer() const { return buffer_; }
  const SampleWindow & throughput_window() const { return throughput_window_; }
  const SampleWindow & rtt_window() const { return rtt_window_; }
  uint64_t bitrate_switches() const { return bitrate_switches_; }
  double segment_duration_s() const { return segment_duration_s_; }

private:
  double segment_duration_s_;

  PlaybackBuffer buffer_;
  SampleWindow throughput_window_;
  SampleWindow rtt_window_;

  std::unique_ptr<MetricSink> sink_;
  std::vector<MetricRecord> records_ {};

  double playback_position_s_ {0};
  uint64_t bitrate_switches_ {0};

  /* representation of the previous record */
  std::optional<std::string> prev_representation_id_ {};

  /* elapsed time already debited from the buffer for the segment in flight */
  std::optional<uint64_t> debit_segment_ {};
  double debited_s_ {0};

  double buffer_debit(const SegmentObservation & obs);
};

#endif /* METRICS_RECORDER_HH */
