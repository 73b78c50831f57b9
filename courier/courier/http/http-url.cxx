#include <courier/http/http-url.hxx>

#include <cctype>
#include <charconv>

#include <courier/http/http-error.hxx>
#include <courier/http/http-types.hxx>

using namespace std;

namespace courier
{
  string url_parts::
  authority () const
  {
    // Put the brackets back for IPv6 literals.
    //
    string h (host.find (':') != string::npos ? '[' + host + ']' : host);
    return port.empty () ? h : h + ':' + port;
  }

  uint16_t url_parts::
  effective_port () const
  {
    if (port.empty ())
      return secure () ? 443 : 80;

    uint16_t p (0);
    from_chars (port.data (), port.data () + port.size (), p);
    return p;
  }

  string url_parts::
  path () const
  {
    return target.substr (0, target.find ('?'));
  }

  string url_parts::
  query () const
  {
    size_t q (target.find ('?'));
    return q != string::npos ? target.substr (q + 1) : string ();
  }

  // Parse a URL string into its components.
  //
  // We are doing this manually to avoid pulling in a full-blown URI library.
  // The scheme://[userinfo@]host[:port]/path?query#fragment shape covers what
  // a request line can contain, including bracketed IPv6 literals.
  //
  url_parts
  parse_url (const string& url)
  {
    auto fail = [&url] (const char* why)
    {
      return configuration_error ("invalid URL '" + url + "': " + why);
    };

    url_parts r;

    size_t p (url.find ("://"));
    if (p == string::npos || p == 0)
      throw fail ("missing scheme");

    r.scheme = to_lower (url.substr (0, p));

    for (char c: r.scheme)
    {
      if (!isalnum (static_cast<unsigned char> (c)) &&
          c != '+' && c != '-' && c != '.')
        throw fail ("invalid scheme");
    }

    size_t b (p + 3);
    size_t e (url.find_first_of ("/?#", b));
    if (e == string::npos)
      e = url.size ();

    string auth (url.substr (b, e - b));

    // Drop the userinfo, if any.
    //
    if (size_t at = auth.rfind ('@'); at != string::npos)
      auth.erase (0, at + 1);

    string port;
    if (!auth.empty () && auth[0] == '[')
    {
      size_t c (auth.find (']'));
      if (c == string::npos)
        throw fail ("unterminated IPv6 address");

      r.host = auth.substr (1, c - 1);

      if (c + 1 < auth.size ())
      {
        if (auth[c + 1] != ':')
          throw fail ("invalid authority");

        port = auth.substr (c + 2);
      }
    }
    else
    {
      size_t c (auth.rfind (':'));
      if (c != string::npos)
      {
        r.host = auth.substr (0, c);
        port = auth.substr (c + 1);
      }
      else
        r.host = auth;
    }

    if (r.host.empty ())
      throw fail ("missing host");

    r.host = to_lower (move (r.host));

    if (!port.empty ())
    {
      unsigned v (0);
      auto [ptr, ec] (from_chars (port.data (), port.data () + port.size (), v));

      if (ec != errc () || ptr != port.data () + port.size () ||
          v == 0 || v > 65535)
        throw fail ("invalid port");

      r.port = move (port);
    }

    // The fragment never goes on the wire.
    //
    size_t f (url.find ('#', e));
    string t (url.substr (e, f == string::npos ? string::npos : f - e));

    if (t.empty () || t[0] != '/')
      t.insert (0, "/");

    r.target = move (t);
    return r;
  }

  string
  encode_url (const string& url)
  {
    // Everything that is either unreserved or reserved per RFC 3986 passes
    // through. A '%' is only kept if it starts a valid escape.
    //
    static const char allowed[] = "!#$&'()*+,-./:;=?@[]_~";
    static const char hex[] = "0123456789ABCDEF";

    string r;
    r.reserve (url.size ());

    for (size_t i (0); i < url.size (); ++i)
    {
      unsigned char c (static_cast<unsigned char> (url[i]));

      if (c == '%' &&
          i + 2 < url.size () &&
          isxdigit (static_cast<unsigned char> (url[i + 1])) &&
          isxdigit (static_cast<unsigned char> (url[i + 2])))
      {
        r += '%';
        continue;
      }

      if (isalnum (c) || (c != 0 && string (allowed).find (c) != string::npos))
      {
        r += static_cast<char> (c);
        continue;
      }

      r += '%';
      r += hex[c >> 4];
      r += hex[c & 0x0f];
    }

    return r;
  }

  string
  resolve_url (const string& base, const string& ref)
  {
    // Absolute reference.
    //
    if (size_t p = ref.find ("://"); p != string::npos &&
        ref.find_first_of ("/?#") > p)
      return ref;

    url_parts b (parse_url (base));

    // Network-path reference (//host/path).
    //
    if (ref.compare (0, 2, "//") == 0)
      return b.scheme + ':' + ref;

    string origin (b.scheme + "://" + b.authority ());

    if (ref.empty ())
      return origin + b.target;

    if (ref[0] == '/')
      return origin + ref;

    if (ref[0] == '?')
      return origin + b.path () + ref;

    // Relative path: replace the last segment of the base path and fold the
    // dot segments.
    //
    string path (b.path ());
    path.erase (path.rfind ('/') + 1);

    string q;
    string r (ref);
    if (size_t p = r.find_first_of ("?#"); p != string::npos)
    {
      q = r.substr (p);
      r.erase (p);
    }

    path += r;

    string out;
    size_t i (0);
    while (i < path.size ())
    {
      size_t j (path.find ('/', i + 1));
      string seg (path.substr (i, j == string::npos ? string::npos : j - i));

      if (seg == "/..")
      {
        size_t k (out.rfind ('/'));
        out.erase (k == string::npos ? 0 : k);

        if (j == string::npos)
          out += '/';
      }
      else if (seg == "/.")
      {
        if (j == string::npos)
          out += '/';
      }
      else
        out += seg;

      if (j == string::npos)
        break;

      i = j;
    }

    if (out.empty ())
      out = "/";

    return origin + out + q;
  }
}
