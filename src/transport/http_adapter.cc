#include "http_adapter.hh"

#include <stdexcept>

using namespace std;

HttpSegmentAdapter::HttpSegmentAdapter(SessionController & session,
                                       const Clock & clock,
                                       const string & base_url)
  : TransportAdapter(session, clock, download_time_rtt()), base_url_(base_url)
{}

optional<Decision> HttpSegmentAdapter::on_response(const uint64_t body_bytes)
{
  if (not session_.in_flight()) {
    throw logic_error(session_.name() + ": response without a request");
  }

  return report(body_bytes, true, true);
}

string HttpSegmentAdapter::segment_url(const SegmentRequest & request) const
{
  string url = base_url_;
  if (not url.empty() and url.back() != '/') {
    url += '/';
  }

  return url + request.representation.id + "/"
         + resource_name(request) + ".m4s";
}
