#pragma once

#include <string>
#include <optional>
#include <filesystem>

#include <courier/courier-settings.hxx>
#include <courier/courier-workspace.hxx>

#include <courier/http/http-transport.hxx>

namespace courier
{
  namespace fs = std::filesystem;

  // Per-host client certificate lookup.
  //
  class certificate_resolver
  {
  public:
    explicit
    certificate_resolver (const workspace_context& w)
        : workspace_ (w) {}

    // Return the certificate material configured for the URL's host[:port]
    // or nullopt if there is none. Paths that do not resolve to an existing
    // file are reported as warnings and left out.
    //
    std::optional<client_certificate>
    resolve (const std::string& url, const courier_settings&) const;

    // Resolve a single absolute or relative path and return the file
    // contents, or nullopt if it cannot be resolved.
    //
    std::optional<std::string>
    load (const std::optional<std::string>& path) const;

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
    std::optional<std::string>
    read (const fs::path&, const std::string& configured) const;

  private:
    const workspace_context& workspace_;
    bool verbose_ = false;
  };
}
