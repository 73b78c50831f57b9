#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include <courier/http/http-types.hxx>
#include <courier/http/http-transport.hxx>

namespace courier
{
  // Parsed WWW-Authenticate: Digest challenge.
  //
  struct digest_challenge
  {
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string algorithm;  // "MD5" if absent.
    std::string qop;        // Comma-separated list, may be empty.
  };

  // Parse a WWW-Authenticate value. Return nullopt if it is not a Digest
  // challenge or lacks a nonce.
  //
  std::optional<digest_challenge>
  parse_digest_challenge (const std::string&);

  // Compute the Authorization header value answering the challenge (RFC
  // 7616 with MD5 or MD5-sess, qop auth or auth-int, or legacy RFC 2069 if
  // the server offers no qop).
  //
  std::string
  digest_authorization (const digest_challenge&,
                        const std::string& username,
                        const std::string& password,
                        http_method,
                        const std::string& uri,
                        const std::string& body,
                        const std::string& cnonce,
                        std::uint32_t nc = 1);

  // Post-response hook that answers a 401 Digest challenge by signing the
  // request and asking for it to be issued again.
  //
  after_response_hook
  digest_hook (std::string username, std::string password);
}
