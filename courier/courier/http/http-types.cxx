#include <courier/http/http-types.hxx>

#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace courier
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::post:    return "POST";
      case http_method::put:     return "PUT";
      case http_method::delete_: return "DELETE";
      case http_method::connect: return "CONNECT";
      case http_method::options: return "OPTIONS";
      case http_method::trace:   return "TRACE";
      case http_method::patch:   return "PATCH";
    }
    return "GET";
  }

  http_method
  to_http_method (const string& s)
  {
    if (iequals (s, "GET"))     return http_method::get;
    if (iequals (s, "HEAD"))    return http_method::head;
    if (iequals (s, "POST"))    return http_method::post;
    if (iequals (s, "PUT"))     return http_method::put;
    if (iequals (s, "DELETE"))  return http_method::delete_;
    if (iequals (s, "CONNECT")) return http_method::connect;
    if (iequals (s, "OPTIONS")) return http_method::options;
    if (iequals (s, "TRACE"))   return http_method::trace;
    if (iequals (s, "PATCH"))   return http_method::patch;

    throw invalid_argument ("invalid HTTP method: " + s);
  }

  bool
  iequals (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  string
  to_lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return s;
  }

  // http_version
  //
  string http_version::
  string () const
  {
    ostringstream os;
    os << static_cast<unsigned> (major) << '.' << static_cast<unsigned> (minor);
    return os.str ();
  }
}
