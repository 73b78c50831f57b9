#pragma once

#include <string>
#include <memory>
#include <utility>
#include <variant>
#include <fstream>
#include <optional>
#include <filesystem>

#include <boost/asio/awaitable.hpp>

#include <courier/http/http-types.hxx>

namespace courier
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Readable byte source for request bodies that are not plain strings
  // (typically a file referenced from the request).
  //
  class byte_source
  {
  public:
    virtual
    ~byte_source () = default;

    // Return the next chunk or nullopt once the source is exhausted.
    //
    virtual asio::awaitable<std::optional<std::string>>
    read () = 0;
  };

  // Byte source over a file.
  //
  class file_source: public byte_source
  {
  public:
    explicit
    file_source (fs::path p, std::size_t chunk = 8192);

    asio::awaitable<std::optional<std::string>>
    read () override;

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

  private:
    fs::path path_;
    std::size_t chunk_;
    std::ifstream ifs_;
  };

  // Byte source over an in-memory buffer. This is what the echoed request in
  // a result carries once the body has been materialized.
  //
  class memory_source: public byte_source
  {
  public:
    explicit
    memory_source (std::string d)
        : data_ (std::move (d)) {}

    asio::awaitable<std::optional<std::string>>
    read () override;

    const std::string&
    data () const noexcept
    {
      return data_;
    }

  private:
    std::string data_;
    bool done_ = false;
  };

  // Read a source to the end.
  //
  asio::awaitable<std::string>
  read_all (byte_source&);

  // Logical HTTP request as authored by the user.
  //
  // The pipeline treats it as immutable: the caller may keep it around and
  // send it again.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;
    using body_type    = std::variant<string_type, std::shared_ptr<byte_source>>;

    http_method               method = http_method::get;
    string_type               url;
    headers_type              headers;
    std::optional<body_type>  body;

    // Body text exactly as authored (before any file inclusion, variable
    // substitution, etc.), and a human-readable request name.
    //
    std::optional<string_type> raw_body;
    string_type                name;

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
        : method (m), url (std::move (u)) {}

    basic_http_request (http_method m, string_type u, headers_type h)
        : method (m), url (std::move (u)), headers (std::move (h)) {}

    std::optional<string_type>
    get_header (const string_type& n) const
    {
      return headers.get (n);
    }

    bool
    has_header (const string_type& n) const
    {
      return headers.contains (n);
    }

    // Body accessors. Note that a streamed body has no string form until it
    // is materialized.
    //
    const string_type*
    string_body () const noexcept
    {
      return body ? std::get_if<string_type> (&*body) : nullptr;
    }

    std::shared_ptr<byte_source>
    stream_body () const
    {
      if (body)
      {
        if (auto* p = std::get_if<std::shared_ptr<byte_source>> (&*body))
          return *p;
      }

      return nullptr;
    }
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url;
  }

  using http_request = basic_http_request<std::string>;
}
