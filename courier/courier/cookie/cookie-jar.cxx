#include <courier/cookie/cookie-jar.hxx>

#include <ctime>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <iostream>

#include <courier/http/http-types.hxx>

using namespace std;

namespace courier
{
  static string
  trim (const string& s)
  {
    size_t b (s.find_first_not_of (" \t"));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (" \t"));
    return s.substr (b, e - b + 1);
  }

  optional<cookie::time_point>
  parse_http_date (const string& s)
  {
    tm t {};
    istringstream is (s);
    is.imbue (locale::classic ());
    is >> get_time (&t, "%a, %d %b %Y %H:%M:%S");

    if (is.fail ())
    {
      // Some servers use dashes (RFC 850 style): 21-Oct-2015.
      //
      t = tm {};
      is.clear ();
      is.str (s);
      is >> get_time (&t, "%a, %d-%b-%Y %H:%M:%S");

      if (is.fail ())
        return nullopt;
    }

    time_t r (timegm (&t));
    if (r == static_cast<time_t> (-1))
      return nullopt;

    return chrono::system_clock::from_time_t (r);
  }

  optional<cookie>
  parse_set_cookie (const string& value,
                    const url_parts& origin,
                    cookie::time_point now)
  {
    string pair (value.substr (0, value.find (';')));
    size_t eq (pair.find ('='));

    if (eq == string::npos)
      return nullopt;

    cookie c;
    c.name = trim (pair.substr (0, eq));
    c.value = trim (pair.substr (eq + 1));

    if (c.name.empty ())
      return nullopt;

    optional<cookie::time_point> expires;
    optional<cookie::time_point> max_age;
    string domain;
    string path;

    for (size_t p (value.find (';')); p != string::npos; )
    {
      size_t n (value.find (';', p + 1));
      string av (value.substr (p + 1, n == string::npos ? n : n - p - 1));
      p = n;

      size_t e (av.find ('='));
      string k (to_lower (trim (av.substr (0, e))));
      string v (e != string::npos ? trim (av.substr (e + 1)) : string ());

      if (k == "expires")
        expires = parse_http_date (v);
      else if (k == "max-age")
      {
        char* end (nullptr);
        long long s (strtoll (v.c_str (), &end, 10));

        if (!v.empty () && *end == '\0')
          max_age = s > 0 ? now + chrono::seconds (s) : cookie::time_point::min ();
      }
      else if (k == "domain")
      {
        if (!v.empty () && v[0] == '.')
          v.erase (0, 1);

        domain = to_lower (v);
      }
      else if (k == "path")
        path = v;
      else if (k == "secure")
        c.secure = true;
      else if (k == "httponly")
        c.http_only = true;
    }

    // Max-Age takes precedence over Expires.
    //
    if (max_age)
      c.expires = max_age;
    else if (expires)
      c.expires = expires;

    if (domain.empty ())
    {
      c.domain = origin.host;
      c.host_only = true;
    }
    else
    {
      if (!domain_match (origin.host, domain))
        return nullopt;

      c.domain = domain;
      c.host_only = false;
    }

    c.path = !path.empty () && path[0] == '/'
      ? path
      : default_cookie_path (origin.path ());

    return c;
  }

  void cookie_jar::
  set_cookie (const string& value, const string& url)
  {
    url_parts u (parse_url (url));
    optional<cookie> c (parse_set_cookie (value, u, chrono::system_clock::now ()));

    if (!c)
    {
      cerr << "warning: ignoring invalid Set-Cookie header from "
           << u.authority () << ": " << value << endl;
      return;
    }

    store_->set (url, move (*c));
  }

  optional<string> cookie_jar::
  cookie_header (const string& url)
  {
    string r;
    for (const cookie& c: store_->get (url))
    {
      if (!r.empty ())
        r += "; ";

      r += c.name;
      r += '=';
      r += c.value;
    }

    return r.empty () ? nullopt : optional<string> (move (r));
  }
}
