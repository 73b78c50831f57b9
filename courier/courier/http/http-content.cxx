#include <courier/http/http-content.hxx>

#include <boost/system/errc.hpp>

#include <courier/http/http-types.hxx>
#include <courier/http/http-error.hxx>

using namespace std;

namespace courier
{
  [[noreturn]] static void
  corrupt (const char* what)
  {
    throw network_error (
      boost::system::errc::make_error_code (boost::system::errc::bad_message),
      what);
  }

  content_coding
  to_content_coding (const optional<string>& v)
  {
    if (!v)
      return content_coding::identity;

    string e (to_lower (*v));

    if (e == "gzip" || e == "x-gzip")
      return content_coding::gzip;

    if (e == "deflate")
      return content_coding::deflate;

    return content_coding::identity;
  }

  content_decoder::
  content_decoder (content_coding c)
      : coding_ (c)
  {
  }

  content_decoder::
  ~content_decoder ()
  {
    if (init_)
      mz_inflateEnd (&stream_);
  }

  string content_decoder::
  decode (const char* d, size_t n)
  {
    if (coding_ == content_coding::identity)
      return string (d, n);

    if (done_)
      return string (); // Trailer or garbage after the end of stream.

    if (!header_done_)
    {
      pending_.append (d, n);

      if (coding_ == content_coding::gzip)
      {
        if (!skip_gzip_header ())
          return string ();

        if (mz_inflateInit2 (&stream_, -MZ_DEFAULT_WINDOW_BITS) != MZ_OK)
          corrupt ("unable to initialize gzip decoder");
      }
      else
      {
        // Deflate is supposed to be zlib-wrapped but some servers send raw
        // deflate data. Tell them apart by the zlib header check bits.
        //
        if (pending_.size () < 2)
          return string ();

        unsigned char b0 (static_cast<unsigned char> (pending_[0]));
        unsigned char b1 (static_cast<unsigned char> (pending_[1]));
        bool zlib ((b0 & 0x0f) == 8 && ((b0 << 8) | b1) % 31 == 0);

        if ((zlib
             ? mz_inflateInit (&stream_)
             : mz_inflateInit2 (&stream_, -MZ_DEFAULT_WINDOW_BITS)) != MZ_OK)
          corrupt ("unable to initialize deflate decoder");
      }

      init_ = true;
      header_done_ = true;

      string p (move (pending_));
      pending_.clear ();
      return inflate (p.data (), p.size ());
    }

    return inflate (d, n);
  }

  string content_decoder::
  inflate (const char* d, size_t n)
  {
    string r;
    unsigned char out[16384];

    stream_.next_in = reinterpret_cast<const unsigned char*> (d);
    stream_.avail_in = static_cast<unsigned int> (n);

    while (!done_)
    {
      stream_.next_out = out;
      stream_.avail_out = sizeof (out);

      int s (mz_inflate (&stream_, MZ_SYNC_FLUSH));
      size_t produced (sizeof (out) - stream_.avail_out);
      r.append (reinterpret_cast<const char*> (out), produced);

      if (s == MZ_STREAM_END)
      {
        done_ = true;
        break;
      }

      if (s == MZ_BUF_ERROR)
        break; // Needs more input.

      if (s != MZ_OK)
        corrupt ("invalid compressed response body");

      if (stream_.avail_in == 0 && produced < sizeof (out))
        break;
    }

    return r;
  }

  bool content_decoder::
  skip_gzip_header ()
  {
    const string& p (pending_);

    if (p.size () < 10)
      return false;

    if (static_cast<unsigned char> (p[0]) != 0x1f ||
        static_cast<unsigned char> (p[1]) != 0x8b ||
        p[2] != 8)
      corrupt ("invalid gzip header");

    unsigned char flags (static_cast<unsigned char> (p[3]));
    size_t i (10);

    if (flags & 0x04) // FEXTRA
    {
      if (p.size () < i + 2)
        return false;

      size_t xlen (static_cast<unsigned char> (p[i]) |
                   static_cast<unsigned char> (p[i + 1]) << 8);
      i += 2 + xlen;
    }

    for (unsigned char f: {0x08, 0x10}) // FNAME, FCOMMENT
    {
      if (flags & f)
      {
        size_t z (i < p.size () ? p.find ('\0', i) : string::npos);
        if (z == string::npos)
          return false;

        i = z + 1;
      }
    }

    if (flags & 0x02) // FHCRC
      i += 2;

    if (p.size () < i)
      return false;

    pending_.erase (0, i);
    return true;
  }

  void content_decoder::
  finish () const
  {
    if (coding_ != content_coding::identity && header_done_ && !done_)
      corrupt ("truncated compressed response body");
  }
}
