#include "metric_record.hh"

#include "strict_conversions.hh"

using namespace std;

static string bool_to_string(const bool b)
{
  return b ? "1" : "0";
}

string MetricRecord::csv_header()
{
  return "timestamp_ms,segment_index,representation_id,bitrate_bps,"
         "byte_count,elapsed_s,throughput_bps,smoothed_throughput_bps,"
         "rtt_estimate_s,buffer_level_s,rebuffer_count,total_rebuffer_s,"
         "playback_position_s,is_rebuffering,bitrate_switch,goodput_bps,"
         "loss_estimate,is_complete";
}

string MetricRecord::to_csv() const
{
  return std::to_string(timestamp_ms) + ","
       + std::to_string(segment_index) + ","
       + representation_id + ","
       + std::to_string(bitrate_bps) + ","
       + std::to_string(byte_count) + ","
       + double_to_string(elapsed_s, 3) + ","
       + double_to_string(throughput_bps, 1) + ","
       + double_to_string(smoothed_throughput_bps, 1) + ","
       + double_to_string(rtt_estimate_s, 4) + ","
       + double_to_string(buffer_level_s, 3) + ","
       + std::to_string(rebuffer_count) + ","
       + double_to_string(total_rebuffer_s, 3) + ","
       + double_to_string(playback_position_s, 3) + ","
       + bool_to_string(is_rebuffering) + ","
       + bool_to_string(bitrate_switch) + ","
       + double_to_string(goodput_bps, 1) + ","
       + double_to_string(loss_estimate, 4) + ","
       + bool_to_string(is_complete);
}

string SessionSummary::to_string() const
{
  string ret = "=== Streaming Session Summary ===\n";

  ret += "Records: " + std::to_string(record_count) + "\n";
  ret += "Completed segments: " + std::to_string(completed_segments) + "\n";
  ret += "Timed-out segments: " + std::to_string(timed_out_segments) + "\n";
  ret += "Total rebuffering events: " + std::to_string(rebuffer_count) + "\n";
  ret += "Total rebuffering duration: "
         + double_to_string(total_rebuffer_s, 2) + " seconds\n";

  ret += "Average throughput: "
         + double_to_string(mean_throughput_bps / 1e6, 2) + " Mbps\n";
  ret += "Max throughput: "
         + double_to_string(max_throughput_bps / 1e6, 2) + " Mbps\n";
  ret += "Min throughput: "
         + double_to_string(min_throughput_bps / 1e6, 2) + " Mbps\n";

  ret += "Average RTT: " + double_to_string(mean_rtt_s * 1000, 1) + " ms\n";
  ret += "Max RTT: " + double_to_string(max_rtt_s * 1000, 1) + " ms\n";
  ret += "Min RTT: " + double_to_string(min_rtt_s * 1000, 1) + " ms\n";

  ret += "Maximum buffer level: " + double_to_string(max_buffer_s, 2)
         + " seconds\n";
  ret += "Average buffer level: " + double_to_string(mean_buffer_s, 2)
         + " seconds\n";
  ret += "Minimum buffer level: " + double_to_string(min_buffer_s, 2)
         + " seconds\n";

  ret += "Bitrate switches: " + std::to_string(bitrate_switches) + "\n";
  ret += "Goodput efficiency: "
         + double_to_string(goodput_efficiency * 100, 1) + "%\n";

  return ret;
}
