#include "stream_trace.hh"

#include <fstream>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

StreamTrace::StreamTrace(const Clock & clock, const string & vantage_point)
  : clock_(clock), vantage_point_(vantage_point), start_ms_(clock.now_ms())
{}

void StreamTrace::log_event(const string & category, const string & event_type,
                            json data, const optional<uint64_t> stream_id)
{
  if (stream_id) {
    data["stream_id"] = *stream_id;
  }

  events_.push_back({
    {"time", clock_.now_ms() - start_ms_},
    {"name", category + ":" + event_type},
    {"data", move(data)}
  });
}

void StreamTrace::log_connection_start(const string & remote_address)
{
  log_event("connection", "start", {
    {"remote_address", remote_address},
    {"protocol", "QUIC"}
  });
}

void StreamTrace::log_stream_request(const uint64_t stream_id,
                                     const string & resource)
{
  log_event("stream", "request", {
    {"resource", resource},
    {"method", "GET"}
  }, stream_id);
}

void StreamTrace::log_data_received(const uint64_t stream_id,
                                    const uint64_t length,
                                    const uint64_t cumulative_bytes,
                                    const bool is_first_chunk,
                                    const bool is_last_chunk)
{
  log_event("stream", "data_received", {
    {"bytes_received", length},
    {"cumulative_bytes", cumulative_bytes},
    {"is_first_chunk", is_first_chunk},
    {"is_last_chunk", is_last_chunk}
  }, stream_id);
}

void StreamTrace::log_transfer_complete(const uint64_t stream_id,
                                        const uint64_t total_bytes,
                                        const double total_time_s,
                                        const double transfer_time_s)
{
  double transfer_rate_kbps = 0;
  if (transfer_time_s > 0) {
    transfer_rate_kbps = total_bytes * 8 / 1024.0 / transfer_time_s;
  }

  log_event("stream", "transfer_complete", {
    {"total_bytes", total_bytes},
    {"total_time_ms", total_time_s * 1000},
    {"transfer_rate_kbps", transfer_rate_kbps}
  }, stream_id);
}

void StreamTrace::log_timeout(const uint64_t stream_id,
                              const uint64_t segment_index)
{
  log_event("stream", "timeout", {
    {"segment_index", segment_index}
  }, stream_id);
}

void StreamTrace::log_metrics(const MetricRecord & record)
{
  log_event("metrics", "segment_complete", {
    {"segment_index", record.segment_index},
    {"representation_id", record.representation_id},
    {"bitrate", record.bitrate_bps},
    {"throughput_bps", record.throughput_bps},
    {"smoothed_throughput_bps", record.smoothed_throughput_bps},
    {"rtt_estimate_ms", record.rtt_estimate_s * 1000},
    {"buffer_level_sec", record.buffer_level_s},
    {"rebuffering_count", record.rebuffer_count},
    {"is_rebuffering", record.is_rebuffering}
  });
}

json StreamTrace::to_json() const
{
  return {
    {"qlog_version", "draft-01"},
    {"title", "Stream trace"},
    {"description", "Stream-level events with metrics"},
    {"trace", {
      {"vantage_point", {{"name", vantage_point_}, {"type", "client"}}},
      {"common_fields", {{"reference_time", start_ms_},
                         {"time_units", "ms"}}},
      {"events", events_}
    }}
  };
}

void StreamTrace::save(const fs::path & path) const
{
  ofstream trace_file(path);
  if (not trace_file) {
    throw runtime_error("cannot open " + path.string());
  }

  trace_file << to_json().dump(2) << endl;

  if (not trace_file) {
    throw runtime_error("failed to write " + path.string());
  }
}
