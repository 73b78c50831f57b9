#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace courier
{
  // HTTP method (verb).
  //
  enum class http_method
  {
    get,
    head,
    post,
    put,
    delete_,
    connect,
    options,
    trace,
    patch
  };

  std::string
  to_string (http_method);

  // Parse a method name case-insensitively. Throw std::invalid_argument if
  // the name is not a known method.
  //
  http_method
  to_http_method (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Case-insensitive (ASCII) comparison of header names, media types, and
  // the like.
  //
  bool
  iequals (const std::string&, const std::string&) noexcept;

  std::string
  to_lower (std::string);

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return !(x == y);
  }

  // HTTP header mapping.
  //
  // Names keep the case they were stored with (and the order of insertion)
  // while every lookup is case-insensitive. Copies are cheap shallow clones
  // of the field list, which is what the request pipeline relies on to never
  // touch a caller's mapping.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get the first value of a header field. Return nullopt if not found.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    // Field names in storage order.
    //
    std::vector<string_type>
    names () const;

    void
    clear () noexcept
    {
      fields.clear ();
    }

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept { return fields.begin (); }
    const_iterator begin () const noexcept { return fields.begin (); }
    iterator       end ()         noexcept { return fields.end (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y) noexcept
  {
    return x.fields == y.fields;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_headers<S>& x, const basic_http_headers<S>& y) noexcept
  {
    return !(x == y);
  }

  // Re-case header names.
  //
  // Every name in h is replaced by the first name in raw that matches it
  // case-insensitively (first-seen case wins). Names without a match are
  // kept as is. Values and order are preserved.
  //
  template <typename S>
  basic_http_headers<S>
  normalize_header_names (const basic_http_headers<S>& h,
                          const std::vector<S>& raw);

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    bool
    operator!= (const http_version& v) const noexcept
    {
      return !(*this == v);
    }

    // Return the version as "1.1", the way it is echoed back to callers.
    //
    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << "HTTP/" << v.string ();
  }
}

#include <courier/http/http-types.ixx>
