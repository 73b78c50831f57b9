#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>

#include <courier/http/http-transport.hxx>

namespace courier
{
  namespace asio = boost::asio;

  // Cognito user pool sign-in parameters taken from an authorization line
  // of the form:
  //
  // Cognito <username> <password> <region> <userPoolId> <clientId>
  //
  struct cognito_parameters
  {
    std::string username;
    std::string password;
    std::string region;
    std::string user_pool_id;
    std::string client_id;
  };

  // Throw auth_resolution_error if the line is malformed.
  //
  cognito_parameters
  parse_cognito_authorization (const std::string&);

  // Obtains a session for a user pool user and returns its access token.
  // Throws auth_resolution_error on failure.
  //
  class cognito_authenticator
  {
  public:
    virtual
    ~cognito_authenticator () = default;

    virtual asio::awaitable<std::string>
    authenticate (const cognito_parameters&) = 0;
  };

  // Authenticator talking to the Cognito Identity Provider service
  // (InitiateAuth with the USER_PASSWORD_AUTH flow) over a transport.
  //
  class cognito_idp_authenticator: public cognito_authenticator
  {
  public:
    explicit
    cognito_idp_authenticator (http_transport& t)
        : transport_ (t) {}

    asio::awaitable<std::string>
    authenticate (const cognito_parameters&) override;

  private:
    http_transport& transport_;
  };

  // Resolve the session up front and return the pre-request hook that puts
  // the access token into the Authorization header.
  //
  asio::awaitable<before_request_hook>
  cognito_hook (const std::string& authorization, cognito_authenticator&);
}
