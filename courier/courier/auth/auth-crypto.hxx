#pragma once

#include <string>
#include <cstddef>

namespace courier
{
  // Thin wrappers over the OpenSSL primitives the authentication schemes
  // need. All digests are returned as lower-case hex unless noted.
  //
  std::string
  md5_hex (const std::string&);

  std::string
  sha256_hex (const std::string&);

  // Raw (binary) HMAC-SHA256.
  //
  std::string
  hmac_sha256 (const std::string& key, const std::string& data);

  std::string
  to_hex (const std::string& bytes);

  std::string
  base64_encode (const std::string&);

  // Cryptographically random bytes as hex (2 * n characters).
  //
  std::string
  random_hex (std::size_t n);
}
