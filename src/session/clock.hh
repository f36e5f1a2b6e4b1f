#ifndef CLOCK_HH
#define CLOCK_HH

#include <cstdint>

/* source of "now" for rebuffer timing and timeouts */
class Clock
{
public:
  virtual ~Clock() {}

  /* milliseconds */
  virtual uint64_t now_ms() const = 0;
};

/* wall clock (milliseconds since epoch) */
class SystemClock : public Clock
{
public:
  uint64_t now_ms() const override;
};

/* clock that only moves when told to; drives trace replay and tests */
class ManualClock : public Clock
{
public:
  ManualClock(const uint64_t start_ms = 0) : now_ms_(start_ms) {}

  uint64_t now_ms() const override { return now_ms_; }

  /* time never goes backwards */
  void set_ms(const uint64_t ms);
  void advance_ms(const uint64_t delta_ms) { now_ms_ += delta_ms; }

private:
  uint64_t now_ms_;
};

#endif /* CLOCK_HH */
