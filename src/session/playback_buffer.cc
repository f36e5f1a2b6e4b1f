#include "playback_buffer.hh"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "timestamp.hh"

using namespace std;

PlaybackBuffer::PlaybackBuffer(const Clock & clock)
  : clock_(clock)
{}

bool PlaybackBuffer::update(const double elapsed_s,
                            const double segment_duration_s,
                            const bool is_segment_complete)
{
  if (elapsed_s < 0) {
    throw invalid_argument("PlaybackBuffer: negative elapsed time "
                           + to_string(elapsed_s));
  }

  if (segment_duration_s < 0) {
    throw invalid_argument("PlaybackBuffer: negative segment duration "
                           + to_string(segment_duration_s));
  }

  bool was_rebuffering = false;

  /* debit, then detect, then credit */
  if (state_.level_s > 0) {
    state_.level_s = max(0.0, state_.level_s - elapsed_s);
  }

  if (state_.level_s <= 0 and not stalled()) {
    state_.rebuffer_started_at_ms = clock_.now_ms();
    state_.rebuffer_count++;
    was_rebuffering = true;
  }

  /* partial observations never credit */
  if (is_segment_complete) {
    state_.level_s += segment_duration_s;
  }

  if (stalled() and state_.level_s > 0) {
    const uint64_t now = clock_.now_ms();
    const uint64_t started = *state_.rebuffer_started_at_ms;
    state_.total_rebuffer_s += (double) (now - min(now, started)) / THOUSAND;
    state_.rebuffer_started_at_ms.reset();
  }

  return was_rebuffering;
}
