#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <ostream>

#include <courier/http/http-types.hxx>
#include <courier/http/http-request.hxx>
#include <courier/http/http-transport.hxx>

namespace courier
{
  // Decoded response.
  //
  // The object is exposed to the caller as soon as the dispatch resolves,
  // which for event streams happens before the body is complete. From then
  // on body only grows (append-only) and the counters only increase.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;
    using request_type = basic_http_request<string_type>;

    std::uint16_t  status = 0;
    string_type    reason;   // Status message.
    http_version   version;
    headers_type   headers;

    string_type    body;         // Decoded text.
    string_type    body_buffer;  // Raw bytes.

    std::uint64_t  body_size = 0;     // Body bytes processed so far.
    std::uint64_t  headers_size = 0;  // Approximate header bytes.

    timing_phases  timings;

    // Set once the body has been received in full (or the stream broke off
    // after the result was handed out).
    //
    bool           complete = false;

    // The effective outgoing request, with header names re-cased after the
    // caller's request.
    //
    request_type   request;

    // Live transport request, for cancelling a stream that is still open.
    //
    std::shared_ptr<request_handle> raw;
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}
