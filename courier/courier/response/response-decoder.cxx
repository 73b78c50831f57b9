#include <courier/response/response-decoder.hxx>

#include <cerrno>
#include <cstdint>
#include <stdexcept>

#include <courier/http/http-types.hxx>

using namespace std;

namespace courier
{
  static const char replacement[] = "\xEF\xBF\xBD"; // U+FFFD

  optional<string>
  find_charset (const string& label)
  {
    string l (to_lower (label));

    // Strip quotes left by sloppy servers.
    //
    if (l.size () >= 2 && l.front () == '"' && l.back () == '"')
      l = l.substr (1, l.size () - 2);

    struct alias
    {
      const char* label;
      const char* name;
    };

    static const alias aliases[] = {
      {"utf8",      "UTF-8"},
      {"utf-8",     "UTF-8"},
      {"latin1",    "ISO-8859-1"},
      {"binary",    "ISO-8859-1"},
      {"ucs2",      "UTF-16LE"},
      {"ucs-2",     "UTF-16LE"},
      {"utf16le",   "UTF-16LE"},
      {"utf-16le",  "UTF-16LE"},
      {"ascii",     "ASCII"},
      {"us-ascii",  "ASCII"}};

    string n;
    for (const alias& a: aliases)
    {
      if (l == a.label)
      {
        n = a.name;
        break;
      }
    }

    if (n.empty ())
    {
      if (l.empty ())
        return nullopt;

      n = l;
    }

    iconv_t cd (iconv_open ("UTF-8", n.c_str ()));
    if (cd == reinterpret_cast<iconv_t> (-1))
      return nullopt;

    iconv_close (cd);
    return n;
  }

  charset_decoder::
  charset_decoder (const optional<string>& cs)
  {
    optional<string> n (cs ? find_charset (*cs) : nullopt);
    charset_ = n ? *n : "UTF-8";

    cd_ = iconv_open ("UTF-8", charset_.c_str ());
    if (cd_ == reinterpret_cast<iconv_t> (-1))
      throw runtime_error ("unable to open " + charset_ + " decoder");
  }

  charset_decoder::
  ~charset_decoder ()
  {
    iconv_close (cd_);
  }

  string charset_decoder::
  decode (const char* d, size_t n)
  {
    pending_.append (d, n);

    string r;
    char out[4096];

    char* in (pending_.data ());
    size_t inl (pending_.size ());

    while (inl != 0)
    {
      char* o (out);
      size_t ol (sizeof (out));

      size_t c (iconv (cd_, &in, &inl, &o, &ol));
      r.append (out, o - out);

      if (c != static_cast<size_t> (-1))
        break;

      if (errno == E2BIG)
        continue;

      if (errno == EINVAL)
        break; // Incomplete sequence, wait for more.

      // EILSEQ: skip one byte.
      //
      r += replacement;
      ++in;
      --inl;
    }

    pending_.erase (0, pending_.size () - inl);
    return r;
  }

  string charset_decoder::
  flush ()
  {
    string r;

    if (!pending_.empty ())
    {
      r += replacement;
      pending_.clear ();
    }

    iconv (cd_, nullptr, nullptr, nullptr, nullptr);
    return r;
  }

  // unicode_unescaper
  //
  static void
  append_utf8 (string& r, uint32_t c)
  {
    if (c < 0x80)
      r += static_cast<char> (c);
    else if (c < 0x800)
    {
      r += static_cast<char> (0xC0 | (c >> 6));
      r += static_cast<char> (0x80 | (c & 0x3F));
    }
    else if (c < 0x10000)
    {
      r += static_cast<char> (0xE0 | (c >> 12));
      r += static_cast<char> (0x80 | ((c >> 6) & 0x3F));
      r += static_cast<char> (0x80 | (c & 0x3F));
    }
    else
    {
      r += static_cast<char> (0xF0 | (c >> 18));
      r += static_cast<char> (0x80 | ((c >> 12) & 0x3F));
      r += static_cast<char> (0x80 | ((c >> 6) & 0x3F));
      r += static_cast<char> (0x80 | (c & 0x3F));
    }
  }

  static int
  hex_value (char c)
  {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  // Parse \uXXXX at position i. Return the code unit or -1.
  //
  static int32_t
  escape_at (const string& s, size_t i)
  {
    if (i + 6 > s.size () || s[i] != '\\' || (s[i + 1] != 'u' && s[i + 1] != 'U'))
      return -1;

    int32_t v (0);
    for (size_t j (i + 2); j != i + 6; ++j)
    {
      int h (hex_value (s[j]));
      if (h < 0)
        return -1;

      v = v * 16 + h;
    }

    return v;
  }

  // Return true if the tail of s starting at i may still become an escape
  // (or the low half of a surrogate pair) once more text arrives.
  //
  static bool
  partial_escape (const string& s, size_t i)
  {
    if (s[i] != '\\')
      return false;

    size_t n (s.size () - i);
    if (n >= 6)
      return false;

    if (n >= 2 && s[i + 1] != 'u' && s[i + 1] != 'U')
      return false;

    for (size_t j (i + 2); j < s.size (); ++j)
      if (hex_value (s[j]) < 0)
        return false;

    return true;
  }

  static string
  unescape (string& s, bool final)
  {
    string r;
    size_t i (0);

    while (i < s.size ())
    {
      if (s[i] != '\\')
      {
        r += s[i++];
        continue;
      }

      int32_t u (escape_at (s, i));

      if (u < 0)
      {
        if (!final && partial_escape (s, i))
          break;

        r += s[i++];
        continue;
      }

      if (u >= 0xD800 && u <= 0xDBFF)
      {
        int32_t l (escape_at (s, i + 6));

        if (l >= 0xDC00 && l <= 0xDFFF)
        {
          append_utf8 (r, 0x10000 + ((u - 0xD800) << 10) + (l - 0xDC00));
          i += 12;
          continue;
        }

        // The low half may still be on its way.
        //
        if (!final && (i + 6 == s.size () || partial_escape (s, i + 6)))
          break;

        r += replacement;
        i += 6;
        continue;
      }

      if (u >= 0xDC00 && u <= 0xDFFF)
        r += replacement;
      else if (u == '"')
        r += "\\\"";
      else
        append_utf8 (r, static_cast<uint32_t> (u));

      i += 6;
    }

    s.erase (0, i);
    return r;
  }

  string unicode_unescaper::
  feed (const string& t)
  {
    pending_ += t;
    return unescape (pending_, false);
  }

  string unicode_unescaper::
  flush ()
  {
    string r (unescape (pending_, true));
    pending_.clear ();
    return r;
  }

  string
  unescape_unicode (const string& t)
  {
    string s (t);
    return unescape (s, true);
  }
}
