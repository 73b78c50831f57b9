#pragma once

#include <string>
#include <memory>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>

#include <boost/asio/awaitable.hpp>

#include <courier/http/http-types.hxx>

namespace courier
{
  namespace asio = boost::asio;

  class cookie_jar;

  // Request as it is about to go on the wire. This is what pre-request hooks
  // get to mutate and what is echoed back in the result.
  //
  struct transport_request
  {
    http_method                method = http_method::get;
    std::string                url;
    http_headers               headers;
    std::optional<std::string> body;
  };

  // Durations of the request phases. A phase that did not happen (e.g., tls
  // for a plain HTTP request) stays absent.
  //
  struct timing_phases
  {
    using duration = std::chrono::milliseconds;

    std::optional<duration> wait;
    std::optional<duration> dns;
    std::optional<duration> tcp;
    std::optional<duration> tls;
    std::optional<duration> request;
    std::optional<duration> first_byte;
    std::optional<duration> download;
    std::optional<duration> total;
  };

  // Response status line and headers, available before the body.
  //
  struct response_metadata
  {
    std::uint16_t status = 0;
    std::string   reason;
    http_version  version;
    http_headers  headers;  // As received: raw names, duplicates kept.
    timing_phases timings;  // Phases up to the first byte.
  };

  // Pre-request hook: mutate the outgoing request just before send.
  //
  using before_request_hook = std::function<void (transport_request&)>;

  // Post-response hook: inspect the response head. Return true to have the
  // (possibly mutated) request issued once more.
  //
  using after_response_hook =
    std::function<bool (const response_metadata&, transport_request&)>;

  // Client certificate material, loaded into memory.
  //
  struct client_certificate
  {
    std::optional<std::string> cert;
    std::optional<std::string> key;
    std::optional<std::string> pfx;
    std::optional<std::string> passphrase;

    bool
    empty () const noexcept
    {
      return !cert && !key && !pfx;
    }
  };

  // Forwarding agent through an HTTP(S) proxy.
  //
  // Plain targets are forwarded (absolute-form request target); TLS targets
  // are tunneled with CONNECT. The proxy itself is reached over TLS if its
  // scheme is https, in which case strict_ssl decides whether the proxy
  // certificate is verified.
  //
  struct proxy_agent
  {
    enum class mode {forward, tunnel};

    std::string   scheme;
    std::string   host;
    std::uint16_t port = 0;
    bool          strict_ssl = false;
    mode          kind = mode::forward;
  };

  // Fully-resolved configuration for one request. Built fresh per request
  // and never shared.
  //
  struct transport_options
  {
    http_method                method = http_method::get;
    std::string                url;
    http_headers               headers;
    std::optional<std::string> body;

    // Fixed policy.
    //
    bool          follow_redirect = true;
    std::uint8_t  max_redirects = 10;
    bool          throw_http_errors = false;
    std::uint32_t retry = 0;
    bool          decompress = true;
    bool          reject_unauthorized = false;

    std::optional<std::chrono::milliseconds> timeout;

    std::shared_ptr<cookie_jar> cookies;

    std::optional<client_certificate> certificate;
    std::optional<proxy_agent>        agent;

    std::optional<std::string> username;
    std::optional<std::string> password;

    std::vector<before_request_hook> before_request;
    std::vector<after_response_hook> after_response;
  };

  // Receiver of the response event stream. Events for one response arrive
  // strictly in order: on_response, any number of on_data, on_end.
  //
  class response_sink
  {
  public:
    virtual
    ~response_sink () = default;

    virtual void
    on_response (const response_metadata&, const transport_request& sent) = 0;

    virtual void
    on_data (const char* data, std::size_t size) = 0;

    virtual void
    on_end (const timing_phases&) = 0;
  };

  // Cancelable handle of an in-flight request.
  //
  // The transport binds a canceller while it has a live connection. Cancel
  // before binding is remembered and honored as soon as the transport binds.
  //
  class request_handle
  {
  public:
    using canceller = std::function<void ()>;

    void
    cancel ();

    bool
    cancelled () const noexcept
    {
      return cancelled_;
    }

    void
    bind (canceller);

    void
    unbind () noexcept;

  private:
    bool      cancelled_ = false;
    canceller canceller_;
  };

  // Transport collaborator.
  //
  // Issues the request described by the options and reports the response
  // to the sink. Throws network_error on connection-level failures. A
  // non-2xx status is reported like any other response.
  //
  class http_transport
  {
  public:
    virtual
    ~http_transport () = default;

    virtual asio::awaitable<void>
    perform (transport_options,
             response_sink&,
             std::shared_ptr<request_handle>) = 0;
  };
}
