#ifndef STREAM_TRACE_HH
#define STREAM_TRACE_HH

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "clock.hh"
#include "filesystem.hh"
#include "metric_record.hh"

/* stream-level event log in the qlog (draft-01) layout; event times are
 * milliseconds since the trace was created */
class StreamTrace
{
public:
  StreamTrace(const Clock & clock, const std::string & vantage_point);

  void log_event(const std::string & category, const std::string & event_type,
                 nlohmann::json data = nlohmann::json::object(),
                 const std::optional<uint64_t> stream_id = std::nullopt);

  void log_connection_start(const std::string & remote_address);
  void log_stream_request(const uint64_t stream_id, const std::string & resource);
  void log_data_received(const uint64_t stream_id, const uint64_t length,
                         const uint64_t cumulative_bytes,
                         const bool is_first_chunk, const bool is_last_chunk);
  void log_transfer_complete(const uint64_t stream_id,
                             const uint64_t total_bytes,
                             const double total_time_s,
                             const double transfer_time_s);
  void log_timeout(const uint64_t stream_id, const uint64_t segment_index);
  void log_metrics(const MetricRecord & record);

  nlohmann::json to_json() const;

  /* write the whole trace as one JSON document */
  void save(const fs::path & path) const;

  const nlohmann::json & events() const { return events_; }

private:
  const Clock & clock_;
  std::string vantage_point_;
  uint64_t start_ms_;

  nlohmann::json events_ = nlohmann::json::array();
};

#endif /* STREAM_TRACE_HH */
