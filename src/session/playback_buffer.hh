#ifndef PLAYBACK_BUFFER_HH
#define PLAYBACK_BUFFER_HH

#include <cstdint>
#include <optional>

#include "clock.hh"

struct BufferState
{
  double level_s {0};  /* never negative */
  uint64_t rebuffer_count {0};
  double total_rebuffer_s {0};

  /* set iff playback is currently stalled */
  std::optional<uint64_t> rebuffer_started_at_ms {};
};

/* Simulated client playback buffer. Elapsed download time drains the buffer
 * (playback continues while a segment is in flight) and each completed
 * segment adds its duration. Draining to zero starts a stall; the next credit
 * that leaves the buffer non-empty ends it. */
class PlaybackBuffer
{
public:
  PlaybackBuffer(const Clock & clock);

  /* debit elapsed_s, then credit segment_duration_s if the segment is
   * complete; returns true iff this call started a stall */
  bool update(const double elapsed_s, const double segment_duration_s,
              const bool is_segment_complete);

  /* accessors */
  const BufferState & state() const { return state_; }
  double level_s() const { return state_.level_s; }
  uint64_t rebuffer_count() const { return state_.rebuffer_count; }
  double total_rebuffer_s() const { return state_.total_rebuffer_s; }
  bool stalled() const { return state_.rebuffer_started_at_ms.has_value(); }

private:
  /* it is safe to hold a reference as the clock outlives the session */
  const Clock & clock_;

  BufferState state_ {};
};

#endif /* PLAYBACK_BUFFER_HH */
