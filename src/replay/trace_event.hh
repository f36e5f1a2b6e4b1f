#ifndef TRACE_EVENT_HH
#define TRACE_EVENT_HH

#include <cstdint>
#include <optional>
#include <string>

/* one line of a recorded transport trace:
 *   <time_ms> data <bytes> [end]
 *   <time_ms> tick
 * blank lines and lines starting with '#' carry no event */
struct TraceEvent
{
  uint64_t time_ms {};
  bool is_data {false};
  uint64_t bytes {};
  bool end {false};
};

/* throws std::runtime_error on a malformed line */
std::optional<TraceEvent> parse_trace_line(const std::string & line);

#endif /* TRACE_EVENT_HH */
