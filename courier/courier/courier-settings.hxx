#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace courier
{
  namespace fs = std::filesystem;

  // Client certificate configuration for one host[:port]. Paths may be
  // absolute or relative to the workspace.
  //
  struct certificate_config
  {
    std::optional<std::string> cert;
    std::optional<std::string> key;
    std::optional<std::string> pfx;
    std::optional<std::string> passphrase;
  };

  // User settings that shape outgoing requests.
  //
  struct courier_settings
  {
    // Request timeout. Zero or negative means no timeout.
    //
    std::int64_t timeout_ms = 0;

    bool follow_redirect = true;

    // Proxy URL (http or https) or empty, hosts (host or host:port) that
    // bypass it, and whether the proxy certificate is verified.
    //
    std::string              proxy;
    std::vector<std::string> exclude_hosts_for_proxy;
    bool                     proxy_strict_ssl = false;

    bool remember_cookies = true;
    bool decode_escaped_unicode = false;

    // Keyed by host[:port] exactly as it appears in request URLs.
    //
    std::map<std::string, certificate_config> host_certificates;
  };

  // Parse settings from a JSON document. Keys are matched case-insensitively
  // and may carry the rest-client. or http. prefix. Unknown keys are ignored.
  //
  // Throw configuration_error on invalid JSON or mistyped values.
  //
  courier_settings
  parse_settings (const std::string& json);

  courier_settings
  load_settings (const fs::path&);
}
