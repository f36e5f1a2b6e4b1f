#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "exception.hh"
#include "test_util.hh"
#include "trace_event.hh"

using namespace std;

void test_valid_lines()
{
  auto event = parse_trace_line("120 data 40000");
  check(event and event->is_data, "data line");
  check(event->time_ms == 120 and event->bytes == 40000, "data fields");
  check(not event->end, "no end marker");

  event = parse_trace_line("  400   data 135000 end ");
  check(event and event->end, "end of segment");
  check(event->bytes == 135000, "extra whitespace");

  event = parse_trace_line("15000 tick");
  check(event and not event->is_data, "tick line");
  check(event->time_ms == 15000, "tick time");
}

void test_ignored_lines()
{
  check(not parse_trace_line(""), "blank line");
  check(not parse_trace_line("   "), "whitespace only");
  check(not parse_trace_line("# comment"), "comment");
  check(not parse_trace_line("  #indented comment"), "indented comment");
}

void test_invalid_lines()
{
  for (const auto & line : {"100", "100 data", "100 data -5", "100 data 5 done",
                            "abc tick", "100 tock", "100 tick 5"}) {
    check_throws<runtime_error>([&line]() { parse_trace_line(line); },
                                string("\"") + line + "\"");
  }
}

int main(int argc, char * argv[])
{
  if (argc < 1) {
    abort();
  }

  try {
    test_valid_lines();
    test_ignored_lines();
    test_invalid_lines();
  } catch (const exception & e) {
    print_exception(argv[0], e);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
