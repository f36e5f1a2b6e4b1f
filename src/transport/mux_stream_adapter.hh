#ifndef MUX_STREAM_ADAPTER_HH
#define MUX_STREAM_ADAPTER_HH

#include <cstdint>
#include <optional>

#include "stream_trace.hh"
#include "transport_adapter.hh"

/* Multiplexed-stream delivery: each segment is fetched on a fresh
 * client-initiated stream and observed chunk by chunk until end of stream.
 * Every chunk is a partial observation; the end of stream is the final one. */
class MuxStreamAdapter : public TransportAdapter
{
public:
  MuxStreamAdapter(SessionController & session, const Clock & clock,
                   const RttEstimator & rtt_estimator, StreamTrace & trace);

  /* stream carrying the segment in flight */
  std::optional<uint64_t> current_stream_id() const { return current_stream_id_; }

  /* data arrived on a stream; data for any stream other than the current
   * one is ignored */
  std::optional<Decision> on_stream_data(const uint64_t stream_id,
                                         const uint64_t length,
                                         const bool end_stream);

private:
  StreamTrace & trace_;

  /* client-initiated bidirectional streams: 0, 4, 8, ... */
  uint64_t next_stream_id_ {0};
  std::optional<uint64_t> current_stream_id_ {};
  std::optional<uint64_t> first_chunk_ms_ {};

  void on_request(const SegmentRequest & request) override;
  void on_decision(const Decision & decision) override;
  void on_abort() override;
};

#endif /* MUX_STREAM_ADAPTER_HH */
