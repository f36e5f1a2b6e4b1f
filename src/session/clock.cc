#include "clock.hh"

#include <stdexcept>
#include <string>

#include "timestamp.hh"

using namespace std;

uint64_t SystemClock::now_ms() const
{
  return timestamp_ms();
}

void ManualClock::set_ms(const uint64_t ms)
{
  if (ms < now_ms_) {
    throw invalid_argument("ManualClock: cannot move from "
                           + to_string(now_ms_) + " back to " + to_string(ms));
  }

  now_ms_ = ms;
}
