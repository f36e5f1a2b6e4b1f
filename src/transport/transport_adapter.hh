#ifndef TRANSPORT_ADAPTER_HH
#define TRANSPORT_ADAPTER_HH

#include <optional>
#include <string>

#include "clock.hh"
#include "rtt_estimator.hh"
#include "session_controller.hh"

/* Translates transport callbacks into session progress. The adapter owns the
 * waiting: it must either report the final progress of a segment or poll()
 * until the session times the segment out. */
class TransportAdapter
{
public:
  virtual ~TransportAdapter() {}

  /* start the next segment; nullopt when the session is done */
  std::optional<SegmentRequest> request_next();

  /* time out the segment in flight once its deadline has passed */
  std::optional<Decision> poll();

  /* cancel the session; the segment in flight is still recorded */
  SessionSummary finish();

  /* name of the resource for a request, e.g. "high_seg3" */
  static std::string resource_name(const SegmentRequest & request);

  /* accessors */
  SessionController & session() { return session_; }
  const SessionController & session() const { return session_; }

protected:
  TransportAdapter(SessionController & session, const Clock & clock,
                   const RttEstimator & rtt_estimator);

  /* seconds since the segment in flight was requested */
  double elapsed_s() const;

  /* report progress of the segment in flight */
  std::optional<Decision> report(const uint64_t bytes_so_far,
                                 const bool is_first_chunk,
                                 const bool is_final);

  /* hooks for transport bookkeeping */
  virtual void on_request(const SegmentRequest &) {}
  virtual void on_decision(const Decision &) {}
  virtual void on_abort() {}

  /* it is safe to hold references as the driver owns both for longer */
  SessionController & session_;
  const Clock & clock_;
  RttEstimator rtt_estimator_;

  uint64_t bytes_so_far_ {0};
};

#endif /* TRANSPORT_ADAPTER_HH */
