#include "transport_adapter.hh"

#include "timestamp.hh"

using namespace std;

TransportAdapter::TransportAdapter(SessionController & session,
                                   const Clock & clock,
                                   const RttEstimator & rtt_estimator)
  : session_(session), clock_(clock), rtt_estimator_(rtt_estimator)
{}

string TransportAdapter::resource_name(const SegmentRequest & request)
{
  return request.representation.id + "_seg"
         + to_string(request.segment_index);
}

optional<SegmentRequest> TransportAdapter::request_next()
{
  auto request = session_.next_request();
  if (request) {
    bytes_so_far_ = 0;
    on_request(*request);
  }

  return request;
}

double TransportAdapter::elapsed_s() const
{
  const auto start_ms = session_.request_start_ms();
  if (not start_ms) {
    return 0;
  }

  return (double) (clock_.now_ms() - *start_ms) / THOUSAND;
}

optional<Decision> TransportAdapter::report(const uint64_t bytes_so_far,
                                            const bool is_first_chunk,
                                            const bool is_final)
{
  const double elapsed = elapsed_s();
  bytes_so_far_ = bytes_so_far;

  const auto & repr = session_.current_representation();

  ProgressEvent event;
  event.segment_index = session_.next_segment_index();
  event.representation_id = repr.id;
  event.bytes_so_far = bytes_so_far;
  event.elapsed_so_far_s = elapsed;
  event.is_first_chunk = is_first_chunk;
  event.is_final = is_final;

  auto decision = session_.on_progress(event,
                                       rtt_estimator_(bytes_so_far, elapsed));
  if (decision) {
    on_decision(*decision);
  }

  return decision;
}

optional<Decision> TransportAdapter::poll()
{
  const double timeout_s = session_.config().timeout_s;

  auto decision = session_.check_timeout(rtt_estimator_(bytes_so_far_,
                                                        timeout_s));
  if (decision) {
    on_decision(*decision);
  }

  return decision;
}

SessionSummary TransportAdapter::finish()
{
  if (session_.in_flight()) {
    on_abort();
  }

  return session_.finish(rtt_estimator_(bytes_so_far_, elapsed_s()));
}
