#pragma once

#include <boost/asio/awaitable.hpp>

#include <courier/http/http-types.hxx>
#include <courier/http/http-transport.hxx>

#include <courier/auth/auth-cognito.hxx>

namespace courier
{
  namespace asio = boost::asio;

  // Translate an Authorization header into transport directives.
  //
  // The header value is split on whitespace into the scheme, the user, and
  // the rest. Recognized schemes (basic, digest, aws, cognito) have the
  // header removed and are turned into credentials or hooks. Anything else
  // is sent as is.
  //
  class auth_dispatcher
  {
  public:
    explicit
    auth_dispatcher (cognito_authenticator& c)
        : cognito_ (c) {}

    // Rewrite the headers (normally the options' own clone) and augment the
    // options. Completes only once any asynchronous hook setup (Cognito
    // sign-in) is done.
    //
    asio::awaitable<void>
    apply (http_headers&, transport_options&) const;

  private:
    cognito_authenticator& cognito_;
  };
}
