#ifndef HTTP_ADAPTER_HH
#define HTTP_ADAPTER_HH

#include <string>

#include "transport_adapter.hh"

/* Chunked-HTTP delivery: one GET per segment, observed only when the whole
 * response body has arrived. The download time doubles as the RTT sample. */
class HttpSegmentAdapter : public TransportAdapter
{
public:
  HttpSegmentAdapter(SessionController & session, const Clock & clock,
                     const std::string & base_url = "");

  /* the response body of the segment in flight arrived completely */
  std::optional<Decision> on_response(const uint64_t body_bytes);

  /* URL of the media segment for a request */
  std::string segment_url(const SegmentRequest & request) const;

private:
  std::string base_url_;
};

#endif /* HTTP_ADAPTER_HH */
