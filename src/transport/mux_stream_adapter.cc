#include "mux_stream_adapter.hh"

#include <iostream>

#include "timestamp.hh"

using namespace std;

MuxStreamAdapter::MuxStreamAdapter(SessionController & session,
                                   const Clock & clock,
                                   const RttEstimator & rtt_estimator,
                                   StreamTrace & trace)
  : TransportAdapter(session, clock, rtt_estimator), trace_(trace)
{}

void MuxStreamAdapter::on_request(const SegmentRequest & request)
{
  current_stream_id_ = next_stream_id_;
  next_stream_id_ += 4;
  first_chunk_ms_.reset();

  trace_.log_stream_request(*current_stream_id_, resource_name(request));
}

optional<Decision> MuxStreamAdapter::on_stream_data(const uint64_t stream_id,
                                                    const uint64_t length,
                                                    const bool end_stream)
{
  if (not current_stream_id_ or stream_id != *current_stream_id_
      or not session_.in_flight()) {
    cerr << session_.name() << ": ignored " << length
         << " bytes on stale stream " << stream_id << endl;
    return nullopt;
  }

  const bool is_first_chunk = not first_chunk_ms_.has_value();
  if (is_first_chunk) {
    first_chunk_ms_ = clock_.now_ms();
  }

  const uint64_t cumulative = bytes_so_far_ + length;
  trace_.log_data_received(stream_id, length, cumulative,
                           is_first_chunk, end_stream);

  if (end_stream) {
    const double transfer_time_s =
        (double) (clock_.now_ms() - *first_chunk_ms_) / THOUSAND;
    trace_.log_transfer_complete(stream_id, cumulative, elapsed_s(),
                                 transfer_time_s);
  }

  return report(cumulative, is_first_chunk, end_stream);
}

void MuxStreamAdapter::on_decision(const Decision & decision)
{
  if (decision.outcome == SegmentOutcome::TimedOut) {
    trace_.log_timeout(current_stream_id_.value(), decision.segment_index);
  } else {
    trace_.log_metrics(session_.recorder().records().back());
  }

  current_stream_id_.reset();
}

void MuxStreamAdapter::on_abort()
{
  trace_.log_timeout(current_stream_id_.value(),
                     session_.next_segment_index());
  current_stream_id_.reset();
}
