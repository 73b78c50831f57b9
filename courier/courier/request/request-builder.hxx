#pragma once

#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <courier/courier-settings.hxx>

#include <courier/http/http-request.hxx>
#include <courier/http/http-transport.hxx>

#include <courier/auth/auth-dispatcher.hxx>
#include <courier/cert/cert-resolver.hxx>
#include <courier/proxy/proxy-resolver.hxx>
#include <courier/cookie/cookie-store.hxx>

namespace courier
{
  namespace asio = boost::asio;

  // Turns a logical request and the settings into transport options.
  //
  // The request is never modified: headers are cloned before any rewriting
  // and a streamed body is read into memory.
  //
  class request_builder
  {
  public:
    request_builder (const auth_dispatcher& a,
                     const certificate_resolver& c,
                     const proxy_resolver& p)
        : auth_ (a), certificates_ (c), proxy_ (p) {}

    // Throw configuration_error if the URL cannot be parsed and
    // auth_resolution_error if authentication cannot be set up.
    //
    asio::awaitable<transport_options>
    prepare (const http_request&, const courier_settings&) const;

    // Store cookies are bound to when remembering cookies is enabled.
    //
    void
    set_cookie_store (std::shared_ptr<cookie_store> s) noexcept
    {
      store_ = std::move (s);
    }

  private:
    const auth_dispatcher&        auth_;
    const certificate_resolver&   certificates_;
    const proxy_resolver&         proxy_;
    std::shared_ptr<cookie_store> store_;
  };
}
