#include <courier/http/http-mime.hxx>

#include <courier/http/http-types.hxx>

using namespace std;

namespace courier
{
  static string
  trim (const string& s)
  {
    const char* ws (" \t");
    size_t b (s.find_first_not_of (ws));
    if (b == string::npos)
      return string ();

    size_t e (s.find_last_not_of (ws));
    return s.substr (b, e - b + 1);
  }

  media_type
  parse_media_type (const string& v)
  {
    media_type r;

    size_t sc (v.find (';'));
    string mt (trim (v.substr (0, sc)));

    size_t sl (mt.find ('/'));
    r.type = to_lower (trim (mt.substr (0, sl)));

    if (sl != string::npos)
      r.subtype = to_lower (trim (mt.substr (sl + 1)));

    // Parameters: ; name=value or ; name="quoted value".
    //
    while (sc != string::npos)
    {
      size_t b (sc + 1);
      size_t eq (v.find ('=', b));
      size_t nx (v.find (';', b));

      if (eq == string::npos || (nx != string::npos && nx < eq))
      {
        sc = nx;
        continue;
      }

      string n (to_lower (trim (v.substr (b, eq - b))));
      string val;

      size_t i (v.find_first_not_of (" \t", eq + 1));
      if (i != string::npos && v[i] == '"')
      {
        // Quoted string with backslash escapes. Note that a ';' inside the
        // quotes does not end the parameter.
        //
        for (++i; i < v.size () && v[i] != '"'; ++i)
        {
          if (v[i] == '\\' && i + 1 < v.size ())
            ++i;

          val += v[i];
        }

        nx = v.find (';', i);
      }
      else
        val = trim (v.substr (eq + 1, nx == string::npos ? string::npos
                                                          : nx - eq - 1));

      if (!n.empty ())
        r.parameters.emplace (move (n), move (val));

      sc = nx;
    }

    return r;
  }
}
