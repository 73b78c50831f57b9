#pragma once

#include <string>
#include <cstddef>
#include <optional>

#include <iconv.h>

namespace courier
{
  // Map a charset label (as found in a Content-Type header) to the iconv
  // encoding name. Return nullopt if the charset is not supported.
  //
  std::optional<std::string>
  find_charset (const std::string& label);

  // Incremental charset to UTF-8 decoder.
  //
  // A multi-byte sequence split across chunks is held back until the rest
  // arrives. Invalid bytes decode to U+FFFD.
  //
  class charset_decoder
  {
  public:
    // Unsupported or absent charsets decode as UTF-8.
    //
    explicit
    charset_decoder (const std::optional<std::string>& charset);

    ~charset_decoder ();

    charset_decoder (const charset_decoder&) = delete;
    charset_decoder& operator= (const charset_decoder&) = delete;

    std::string
    decode (const char* data, std::size_t size);

    // Decode whatever is still held back (an incomplete trailing sequence
    // becomes U+FFFD).
    //
    std::string
    flush ();

    const std::string&
    charset () const noexcept
    {
      return charset_;
    }

  private:
    std::string charset_;
    iconv_t     cd_;
    std::string pending_;
  };

  // Incremental replacement of literal \uXXXX escapes with the characters
  // they denote (UTF-8 encoded, surrogate pairs combined). A decoded double
  // quote is written as \" so that embedded JSON strings stay intact.
  //
  class unicode_unescaper
  {
  public:
    std::string
    feed (const std::string&);

    std::string
    flush ();

  private:
    std::string pending_;
  };

  // Unescape a complete text.
  //
  std::string
  unescape_unicode (const std::string&);
}
