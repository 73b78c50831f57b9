#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace courier
{
  namespace fs = std::filesystem;

  struct cookie
  {
    using time_point = std::chrono::system_clock::time_point;

    std::string name;
    std::string value;
    std::string domain;   // Lower-case, without leading dot.
    std::string path;

    bool host_only = true;
    bool secure = false;
    bool http_only = false;

    // Absent for session cookies.
    //
    std::optional<time_point> expires;

    bool
    expired (time_point now) const noexcept
    {
      return expires && *expires <= now;
    }
  };

  // Persistent cookie storage keyed by URL.
  //
  // Note that the store performs no locking: overlapping requests that share
  // a store rely on running on a single executor.
  //
  class cookie_store
  {
  public:
    virtual
    ~cookie_store () = default;

    // Return the unexpired cookies that apply to the URL, longest path
    // first.
    //
    virtual std::vector<cookie>
    get (const std::string& url) = 0;

    // Store a cookie received from the URL, replacing any cookie with the
    // same name, domain, and path. An expired cookie removes the stored one.
    //
    virtual void
    set (const std::string& url, cookie) = 0;

    virtual void
    clear () = 0;
  };

  // In-memory store.
  //
  class memory_cookie_store: public cookie_store
  {
  public:
    std::vector<cookie>
    get (const std::string& url) override;

    void
    set (const std::string& url, cookie) override;

    void
    clear () override;

    const std::vector<cookie>&
    cookies () const noexcept
    {
      return cookies_;
    }

  protected:
    std::vector<cookie> cookies_;
  };

  // Store backed by a JSON file, rewritten after every change. A missing
  // file is an empty store; an unreadable one is reported and treated as
  // empty.
  //
  class file_cookie_store: public memory_cookie_store
  {
  public:
    explicit
    file_cookie_store (fs::path);

    void
    set (const std::string& url, cookie) override;

    void
    clear () override;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

  private:
    void
    load ();

    void
    save () const;

  private:
    fs::path path_;
  };

  // RFC 6265 matching rules.
  //
  bool
  domain_match (const std::string& host, const std::string& domain);

  bool
  path_match (const std::string& request_path, const std::string& cookie_path);

  // Default cookie path for a request path (its "directory").
  //
  std::string
  default_cookie_path (const std::string& request_path);

  // Default cookie file: $XDG_DATA_HOME/courier/cookie.json, falling back to
  // ~/.local/share/courier/cookie.json, then ./.courier/cookie.json.
  //
  fs::path
  default_cookie_file ();
}
