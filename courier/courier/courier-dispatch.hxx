#pragma once

#include <memory>
#include <filesystem>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <courier/courier-settings.hxx>
#include <courier/courier-workspace.hxx>

#include <courier/http/http-request.hxx>
#include <courier/http/http-response.hxx>
#include <courier/http/http-transport.hxx>

#include <courier/auth/auth-cognito.hxx>
#include <courier/auth/auth-dispatcher.hxx>
#include <courier/cert/cert-resolver.hxx>
#include <courier/proxy/proxy-resolver.hxx>
#include <courier/cookie/cookie-store.hxx>
#include <courier/request/request-builder.hxx>

namespace courier
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Request dispatch pipeline: build the transport options, issue the
  // request, and consume the response into a result.
  //
  class http_dispatcher
  {
  public:
    // Sign in to Cognito through the transport itself.
    //
    http_dispatcher (http_transport&,
                     const workspace_context&,
                     fs::path cookie_file);

    http_dispatcher (http_transport&,
                     const workspace_context&,
                     fs::path cookie_file,
                     cognito_authenticator&);

    http_dispatcher (const http_dispatcher&) = delete;
    http_dispatcher& operator= (const http_dispatcher&) = delete;

    // Send the request and return the result once it resolves: at the end
    // of the response or, for event streams, as soon as the head is in.
    //
    // Cancelling the handle before that aborts the request with
    // network_error. Afterwards it only stops a live stream.
    //
    asio::awaitable<std::shared_ptr<http_response>>
    send (const http_request&,
          const courier_settings&,
          std::shared_ptr<request_handle> = nullptr);

    // Remove the cookie file and start over with an empty store.
    //
    void
    clear_cookies ();

    const fs::path&
    cookie_file () const noexcept
    {
      return cookie_file_;
    }

    void
    set_verbose (bool);

    bool
    verbose () const noexcept
    {
      return verbose_;
    }

  private:
    http_transport& transport_;
    fs::path        cookie_file_;
    bool            verbose_ = false;

    std::unique_ptr<cognito_authenticator> own_cognito_;

    auth_dispatcher      auth_;
    certificate_resolver certificates_;
    proxy_resolver       proxy_;
    request_builder      builder_;
  };
}
