#include <courier/http/http-content.hxx>

#include <string>
#include <cassert>
#include <algorithm>
#include <cstring>

#include <miniz.h>

#include <courier/http/http-error.hxx>

using namespace std;
using namespace courier;

static const string text (
  "The quick brown fox jumps over the lazy dog. "
  "The quick brown fox jumps over the lazy dog. "
  "The quick brown fox jumps over the lazy dog.");

// Compress with either a zlib wrapper or as raw deflate.
//
static string
deflate (const string& s, bool raw)
{
  mz_stream z;
  memset (&z, 0, sizeof (z));

  int r (mz_deflateInit2 (&z,
                          MZ_DEFAULT_COMPRESSION,
                          MZ_DEFLATED,
                          raw ? -MZ_DEFAULT_WINDOW_BITS : MZ_DEFAULT_WINDOW_BITS,
                          9,
                          MZ_DEFAULT_STRATEGY));
  assert (r == MZ_OK);

  string out (mz_deflateBound (&z, static_cast<mz_ulong> (s.size ())), '\0');

  z.next_in = reinterpret_cast<const unsigned char*> (s.data ());
  z.avail_in = static_cast<unsigned int> (s.size ());
  z.next_out = reinterpret_cast<unsigned char*> (&out[0]);
  z.avail_out = static_cast<unsigned int> (out.size ());

  r = mz_deflate (&z, MZ_FINISH);
  assert (r == MZ_STREAM_END);

  out.resize (z.total_out);
  mz_deflateEnd (&z);
  return out;
}

static string
gzip (const string& s, bool with_name)
{
  string h ("\x1f\x8b\x08", 3);
  h += static_cast<char> (with_name ? 0x08 : 0x00);
  h += string (6, '\0');   // MTIME, XFL, OS.

  if (with_name)
    h += string ("body.txt\0", 9);

  string t;
  mz_ulong crc (mz_crc32 (MZ_CRC32_INIT,
                          reinterpret_cast<const unsigned char*> (s.data ()),
                          s.size ()));

  for (int i (0); i != 4; ++i)
    t += static_cast<char> ((crc >> (8 * i)) & 0xff);

  for (int i (0); i != 4; ++i)
    t += static_cast<char> ((s.size () >> (8 * i)) & 0xff);

  return h + deflate (s, true) + t;
}

// Feed the input in pieces of the specified size.
//
static string
decode (content_coding c, const string& in, size_t piece)
{
  content_decoder d (c);
  string r;

  for (size_t i (0); i < in.size (); i += piece)
    r += d.decode (in.data () + i, min (piece, in.size () - i));

  d.finish ();
  return r;
}

static void
test_coding ()
{
  assert (to_content_coding (nullopt) == content_coding::identity);
  assert (to_content_coding (string ("GZIP")) == content_coding::gzip);
  assert (to_content_coding (string ("x-gzip")) == content_coding::gzip);
  assert (to_content_coding (string ("deflate")) == content_coding::deflate);
  assert (to_content_coding (string ("br")) == content_coding::identity);
}

static void
test_identity ()
{
  assert (decode (content_coding::identity, text, 7) == text);
}

static void
test_gzip ()
{
  assert (decode (content_coding::gzip, gzip (text, false), 4096) == text);

  // Byte at a time, so that the header is split as well.
  //
  assert (decode (content_coding::gzip, gzip (text, true), 1) == text);
}

static void
test_deflate ()
{
  assert (decode (content_coding::deflate, deflate (text, false), 5) == text);
  assert (decode (content_coding::deflate, deflate (text, true), 5) == text);
}

static void
test_corrupt ()
{
  {
    bool thrown (false);
    try
    {
      decode (content_coding::gzip, string ("not gzip at all"), 64);
    }
    catch (const network_error&)
    {
      thrown = true;
    }
    assert (thrown);
  }

  // Truncated stream.
  //
  {
    string z (gzip (text, false));
    z.resize (z.size () / 2);

    bool thrown (false);
    try
    {
      decode (content_coding::gzip, z, 64);
    }
    catch (const network_error&)
    {
      thrown = true;
    }
    assert (thrown);
  }
}

int
main ()
{
  test_coding ();
  test_identity ();
  test_gzip ();
  test_deflate ();
  test_corrupt ();
}
