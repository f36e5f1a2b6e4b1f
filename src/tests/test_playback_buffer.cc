#include <cstdlib>
#include <iostream>
#include <random>

#include "clock.hh"
#include "exception.hh"
#include "playback_buffer.hh"
#include "test_util.hh"

using namespace std;

void test_stall_lifecycle()
{
  ManualClock clock(0);
  PlaybackBuffer buffer(clock);

  /* startup: empty buffer stalls on the first observation */
  check(buffer.update(0.5, 2, false), "first observation starts a stall");
  check(buffer.stalled(), "stalled after the first observation");
  check(buffer.rebuffer_count() == 1, "one stall");

  /* partial observations inside the same stall do not count again */
  clock.advance_ms(500);
  check(not buffer.update(0.5, 2, false), "partial inside a stall");
  check(buffer.rebuffer_count() == 1, "still one stall");
  check_near(buffer.level_s(), 0, "partials never credit");

  clock.advance_ms(500);
  check(not buffer.update(0.3, 2, true), "completion ends the stall");
  check(not buffer.stalled(), "playing after the credit");
  check_near(buffer.level_s(), 2, "credited one segment");
  check_near(buffer.total_rebuffer_s(), 1.0, "stalled for one second");

  check(not buffer.update(1.5, 2, false), "partial debit while playing");
  check_near(buffer.level_s(), 0.5, "debited 1.5 s");

  clock.advance_ms(1000);
  check(buffer.update(1.0, 2, false), "draining starts a second stall");
  check_near(buffer.level_s(), 0, "level clamps at zero");
  check(buffer.rebuffer_count() == 2, "two stalls");
  check(buffer.state().rebuffer_started_at_ms.value() == 2000,
        "stall start time");

  clock.advance_ms(2500);
  buffer.update(0, 2, true);
  check_near(buffer.total_rebuffer_s(), 3.5, "stall durations add up");
  check(not buffer.state().rebuffer_started_at_ms, "stall start cleared");
}

void test_detect_and_resolve_in_one_update()
{
  ManualClock clock(100);
  PlaybackBuffer buffer(clock);

  check(buffer.update(1.0, 2, true), "stall detected");
  check(not buffer.stalled(), "and resolved by the same credit");
  check_near(buffer.level_s(), 2, "level after credit");
  check(buffer.rebuffer_count() == 1, "counted once");
  check_near(buffer.total_rebuffer_s(), 0, "zero-length stall");
}

void test_negative_elapsed_rejected()
{
  ManualClock clock;
  PlaybackBuffer buffer(clock);

  check_throws<invalid_argument>([&buffer]() { buffer.update(-0.1, 2, true); },
                                 "negative elapsed time");
  check(buffer.rebuffer_count() == 0, "rejected update changed nothing");
}

void test_level_never_negative()
{
  ManualClock clock;
  PlaybackBuffer buffer(clock);

  mt19937 prng(12345);
  uniform_real_distribution<double> elapsed_dist(0, 4);
  bernoulli_distribution complete_dist(0.4);

  double last_total = 0;
  for (int i = 0; i < 1000; i++) {
    const double elapsed = elapsed_dist(prng);
    clock.advance_ms((uint64_t) (elapsed * 1000));
    buffer.update(elapsed, 2, complete_dist(prng));

    check(buffer.level_s() >= 0, "level is never negative");
    check(buffer.total_rebuffer_s() >= last_total,
          "total rebuffer time never decreases");
    check(buffer.stalled() == (buffer.level_s() <= 0),
          "stalled exactly while the buffer is empty");
    last_total = buffer.total_rebuffer_s();
  }
}

int main(int argc, char * argv[])
{
  if (argc < 1) {
    abort();
  }

  try {
    test_stall_lifecycle();
    test_detect_and_resolve_in_one_update();
    test_negative_elapsed_rejected();
    test_level_never_negative();
  } catch (const exception & e) {
    print_exception(argv[0], e);
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
