#pragma once

#include <string>
#include <cstddef>
#include <optional>

#include <miniz.h>

namespace courier
{
  enum class content_coding
  {
    identity,
    gzip,
    deflate
  };

  // Map a Content-Encoding value to a supported coding. Anything we cannot
  // decode is passed through as identity.
  //
  content_coding
  to_content_coding (const std::optional<std::string>&);

  // Incremental response body decoder.
  //
  // Feed the body as it arrives and get back whatever decoded bytes are
  // available so far. Throw network_error on corrupt input.
  //
  class content_decoder
  {
  public:
    explicit
    content_decoder (content_coding);

    ~content_decoder ();

    content_decoder (const content_decoder&) = delete;
    content_decoder& operator= (const content_decoder&) = delete;

    std::string
    decode (const char* data, std::size_t size);

    // Verify the compressed stream ended properly.
    //
    void
    finish () const;

    content_coding
    coding () const noexcept
    {
      return coding_;
    }

  private:
    std::string
    inflate (const char* data, std::size_t size);

    // Return false if more bytes are needed to complete the gzip header.
    //
    bool
    skip_gzip_header ();

  private:
    content_coding coding_;
    mz_stream      stream_ {};
    bool           init_ = false;
    bool           header_done_ = false;
    bool           done_ = false;
    std::string    pending_;  // Header bytes not yet consumed.
  };
}
