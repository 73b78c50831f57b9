#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <courier/http/http-transport.hxx>

namespace courier
{
  namespace asio = boost::asio;

  // HTTP/1.1 transport over Boost.Beast.
  //
  // Every request gets a fresh connection (no pooling). The client handles
  // the transport-level policy found in the options: proxies (forwarding
  // and CONNECT tunnels), client certificates, peer verification, cookies,
  // basic credentials, hooks, redirects, content decoding, and the timeout.
  //
  class http_client: public http_transport
  {
  public:
    explicit
    http_client (asio::io_context& ioc)
        : ioc_ (ioc) {}

    http_client (const http_client&) = delete;
    http_client& operator= (const http_client&) = delete;

    asio::awaitable<void>
    perform (transport_options,
             response_sink&,
             std::shared_ptr<request_handle>) override;

    void
    set_verbose (bool v) noexcept
    {
      verbose_ = v;
    }

    bool
    verbose () const noexcept
    {
      return verbose_;
    }

    // Default User-Agent, used unless the request sets its own.
    //
    std::string user_agent = "courier";

  private:
    asio::awaitable<void>
    perform_impl (transport_options,
                  response_sink&,
                  std::shared_ptr<request_handle>);

  private:
    asio::io_context& ioc_;
    bool verbose_ = false;
  };
}
