#pragma once

#include <string>
#include <memory>
#include <utility>
#include <optional>

#include <courier/http/http-url.hxx>

#include <courier/cookie/cookie-store.hxx>

namespace courier
{
  // Parse a Set-Cookie header value received from the specified origin.
  // Return nullopt if the header is malformed or the Domain attribute does
  // not cover the origin host.
  //
  std::optional<cookie>
  parse_set_cookie (const std::string& value,
                    const url_parts& origin,
                    cookie::time_point now);

  // Parse an RFC 1123 (IMF-fixdate) date as used by the Expires attribute.
  //
  std::optional<cookie::time_point>
  parse_http_date (const std::string&);

  // Cookie jar the transport consults on every hop.
  //
  class cookie_jar
  {
  public:
    explicit
    cookie_jar (std::shared_ptr<cookie_store> s)
        : store_ (std::move (s)) {}

    // Record a Set-Cookie header received in response to the URL. Malformed
    // headers are reported and dropped.
    //
    void
    set_cookie (const std::string& value, const std::string& url);

    // Return the Cookie header value for a request to the URL, if any
    // cookies apply.
    //
    std::optional<std::string>
    cookie_header (const std::string& url);

    cookie_store&
    store () noexcept
    {
      return *store_;
    }

  private:
    std::shared_ptr<cookie_store> store_;
  };
}
