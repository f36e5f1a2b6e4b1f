#ifndef METRIC_RECORD_HH
#define METRIC_RECORD_HH

#include <cstdint>
#include <string>

/* one observation of a segment download, complete or not */
struct SegmentObservation
{
  uint64_t segment_index {};
  std::string representation_id {};
  uint64_t byte_count {};    /* cumulative bytes of the segment so far */
  double elapsed_s {};       /* cumulative time since the segment request */
  uint64_t timestamp_ms {};
  bool is_final {false};     /* completed (true) or partial/timed out */
};

/* immutable snapshot emitted for every observation; member order is the
 * canonical column order of the metric log */
struct MetricRecord
{
  uint64_t timestamp_ms {};
  uint64_t segment_index {};
  std::string representation_id {};
  uint64_t bitrate_bps {};
  uint64_t byte_count {};
  double elapsed_s {};
  double throughput_bps {};
  double smoothed_throughput_bps {};
  double rtt_estimate_s {};
  double buffer_level_s {};
  uint64_t rebuffer_count {};
  double total_rebuffer_s {};
  double playback_position_s {};
  bool is_rebuffering {};
  bool bitrate_switch {};
  double goodput_bps {};
  double loss_estimate {};
  bool is_complete {};

  /* comma-separated row in canonical order */
  std::string to_csv() const;

  static std::string csv_header();
};

struct SessionSummary
{
  uint64_t record_count {0};
  uint64_t completed_segments {0};
  uint64_t timed_out_segments {0};

  uint64_t rebuffer_count {0};
  double total_rebuffer_s {0};

  double min_throughput_bps {0};
  double max_throughput_bps {0};
  double mean_throughput_bps {0};

  double min_rtt_s {0};
  double max_rtt_s {0};
  double mean_rtt_s {0};

  double min_buffer_s {0};
  double max_buffer_s {0};
  double mean_buffer_s {0};

  uint64_t bitrate_switches {0};
  double goodput_efficiency {0};  /* sum(goodput) / sum(throughput) */

  /* human-readable report */
  std::string to_string() const;
};

#endif /* METRIC_RECORD_HH */
