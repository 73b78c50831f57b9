#pragma once

#include <string>
#include <vector>

#include <courier/courier-settings.hxx>

#include <courier/http/http-transport.hxx>

namespace courier
{
  // Return true if the request URL matches one of the proxy exclusion
  // entries (host or host:port, case-insensitive).
  //
  // A URL without an explicit port only matches bare host entries. A URL
  // with an explicit port matches entries with the same host and either no
  // port or the same port.
  //
  bool
  ignore_proxy (const std::string& url, const std::vector<std::string>& exclude);

  class proxy_resolver
  {
  public:
    // Attach a proxy agent to the options unless no proxy is configured, the
    // URL is excluded, or the proxy scheme is not http(s).
    //
    void
    resolve (transport_options&,
             const std::string& url,
             const courier_settings&) const;

    void
    set_verbose (bool v) noexcept
    {
      verbose_ = v;
    }

    bool
    verbose () const noexcept
    {
      return verbose_;
    }

  private:
    bool verbose_ = false;
  };
}
