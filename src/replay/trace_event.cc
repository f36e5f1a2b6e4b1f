#include "trace_event.hh"

#include <sstream>
#include <stdexcept>
#include <vector>

#include "strict_conversions.hh"

using namespace std;

optional<TraceEvent> parse_trace_line(const string & line)
{
  istringstream iss(line);
  vector<string> tokens;
  for (string token; iss >> token;) {
    tokens.push_back(token);
  }

  if (tokens.empty() or tokens.front().front() == '#') {
    return nullopt;
  }

  TraceEvent event;
  event.time_ms = strict_atoui(tokens[0]);

  if (tokens.size() == 2 and tokens[1] == "tick") {
    return event;
  }

  if ((tokens.size() == 3 or tokens.size() == 4) and tokens[1] == "data") {
    event.is_data = true;
    event.bytes = strict_atoui(tokens[2]);

    if (tokens.size() == 4) {
      if (tokens[3] != "end") {
        throw runtime_error("invalid trace line: " + line);
      }
      event.end = true;
    }

    return event;
  }

  throw runtime_error("invalid trace line: " + line);
}
