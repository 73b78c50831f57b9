#pragma once

#include <string>
#include <stdexcept>

#include <boost/system/system_error.hpp>

namespace courier
{
  // Request or settings cannot be turned into a transport request: an
  // unparsable URL, malformed settings, unusable certificate material.
  //
  class configuration_error: public std::runtime_error
  {
  public:
    explicit
    configuration_error (const std::string& what)
        : std::runtime_error (what) {}
  };

  // Authentication could not be resolved before the request was sent (for
  // example, no Cognito session could be obtained).
  //
  class auth_resolution_error: public std::runtime_error
  {
  public:
    explicit
    auth_resolution_error (const std::string& what)
        : std::runtime_error (what) {}
  };

  // Connection-level failure reported by the transport. Never retried.
  //
  class network_error: public boost::system::system_error
  {
  public:
    network_error (boost::system::error_code ec, const std::string& what)
        : boost::system::system_error (ec, what) {}

    // Return true if the failure is the result of request cancellation.
    //
    bool
    cancelled () const noexcept;
  };
}
