#pragma once

#include <string>
#include <cstdint>

namespace courier
{
  // URL parts structure.
  //
  // Only absolute http(s)-style URLs are handled: scheme://authority/target.
  // The host is lower-cased (and stripped of IPv6 brackets); the port is kept
  // exactly as written, empty if the URL does not specify one.
  //
  struct url_parts
  {
    std::string scheme;   // Lower-case, without "://".
    std::string host;
    std::string port;     // Explicit port or empty.
    std::string target;   // Path and query, at least "/".

    // Return host[:port] as written in the URL (modulo host case), without
    // default port normalization.
    //
    std::string
    authority () const;

    // Return the explicit port or the scheme default (443 for https, 80
    // otherwise).
    //
    std::uint16_t
    effective_port () const;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // Target split into path and query (without '?').
    //
    std::string
    path () const;

    std::string
    query () const;
  };

  // Parse an absolute URL. Throw configuration_error if it cannot be parsed.
  //
  url_parts
  parse_url (const std::string&);

  // Percent-encode characters that may not appear in a URL, leaving reserved
  // characters and existing %XX escapes untouched.
  //
  std::string
  encode_url (const std::string&);

  // Resolve a (possibly relative) reference, such as a Location header,
  // against an absolute base URL.
  //
  std::string
  resolve_url (const std::string& base, const std::string& reference);
}
