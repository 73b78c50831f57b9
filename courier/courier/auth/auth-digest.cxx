#include <courier/auth/auth-digest.hxx>

#include <cctype>
#include <cstdio>
#include <utility>

#include <courier/http/http-url.hxx>
#include <courier/auth/auth-crypto.hxx>

using namespace std;

namespace courier
{
  optional<digest_challenge>
  parse_digest_challenge (const string& v)
  {
    size_t i (v.find_first_not_of (" \t"));
    if (i == string::npos || !iequals (v.substr (i, 6), "digest") ||
        (i + 6 < v.size () && !isspace (static_cast<unsigned char> (v[i + 6]))))
      return nullopt;

    digest_challenge r;

    // auth-param list: name=token or name="quoted-string", comma-separated.
    //
    for (i += 6; i < v.size (); )
    {
      i = v.find_first_not_of (" \t,", i);
      if (i == string::npos)
        break;

      size_t eq (v.find ('=', i));
      if (eq == string::npos)
        break;

      string n (to_lower (v.substr (i, eq - i)));
      while (!n.empty () && isspace (static_cast<unsigned char> (n.back ())))
        n.pop_back ();

      string val;
      i = v.find_first_not_of (" \t", eq + 1);
      if (i == string::npos)
        break;

      if (v[i] == '"')
      {
        for (++i; i < v.size () && v[i] != '"'; ++i)
        {
          if (v[i] == '\\' && i + 1 < v.size ())
            ++i;

          val += v[i];
        }

        ++i; // Closing quote.
      }
      else
      {
        size_t e (v.find (',', i));
        val = v.substr (i, e == string::npos ? string::npos : e - i);

        while (!val.empty () && isspace (static_cast<unsigned char> (val.back ())))
          val.pop_back ();

        i = e;
      }

      if      (n == "realm")     r.realm = move (val);
      else if (n == "nonce")     r.nonce = move (val);
      else if (n == "opaque")    r.opaque = move (val);
      else if (n == "algorithm") r.algorithm = move (val);
      else if (n == "qop")       r.qop = move (val);
    }

    if (r.nonce.empty ())
      return nullopt;

    if (r.algorithm.empty ())
      r.algorithm = "MD5";

    return r;
  }

  // Pick the quality of protection: prefer auth over auth-int, empty if the
  // server offers neither.
  //
  static string
  select_qop (const string& offered)
  {
    bool i (false);

    for (size_t b (0); b < offered.size (); )
    {
      size_t e (offered.find (',', b));
      string t (offered.substr (b, e == string::npos ? string::npos : e - b));

      size_t s (t.find_first_not_of (" \t"));
      size_t l (t.find_last_not_of (" \t"));
      t = s == string::npos ? string () : to_lower (t.substr (s, l - s + 1));

      if (t == "auth")
        return t;

      if (t == "auth-int")
        i = true;

      if (e == string::npos)
        break;

      b = e + 1;
    }

    return i ? "auth-int" : string ();
  }

  string
  digest_authorization (const digest_challenge& c,
                        const string& user,
                        const string& pass,
                        http_method m,
                        const string& uri,
                        const string& body,
                        const string& cnonce,
                        uint32_t nc)
  {
    string qop (select_qop (c.qop));

    char ncs[9];
    snprintf (ncs, sizeof (ncs), "%08x", nc);

    string ha1 (md5_hex (user + ':' + c.realm + ':' + pass));

    if (iequals (c.algorithm, "MD5-sess"))
      ha1 = md5_hex (ha1 + ':' + c.nonce + ':' + cnonce);

    string ha2 (qop == "auth-int"
                ? md5_hex (to_string (m) + ':' + uri + ':' + md5_hex (body))
                : md5_hex (to_string (m) + ':' + uri));

    string resp (qop.empty ()
                 ? md5_hex (ha1 + ':' + c.nonce + ':' + ha2)
                 : md5_hex (ha1 + ':' + c.nonce + ':' + ncs + ':' +
                            cnonce + ':' + qop + ':' + ha2));

    string r ("Digest username=\"" + user + "\"" +
              ", realm=\"" + c.realm + "\"" +
              ", nonce=\"" + c.nonce + "\"" +
              ", uri=\"" + uri + "\"" +
              ", algorithm=" + c.algorithm +
              ", response=\"" + resp + "\"");

    if (!c.opaque.empty ())
      r += ", opaque=\"" + c.opaque + "\"";

    if (!qop.empty ())
      r += ", qop=" + qop + ", nc=" + ncs + ", cnonce=\"" + cnonce + "\"";

    return r;
  }

  after_response_hook
  digest_hook (string user, string pass)
  {
    return [user = move (user), pass = move (pass)] (const response_metadata& m,
                                                     transport_request& r)
    {
      if (m.status != 401)
        return false;

      // The server may offer several schemes, each in its own field.
      //
      optional<digest_challenge> c;
      for (const http_field& f: m.headers)
      {
        if (iequals (f.name, "WWW-Authenticate") &&
            (c = parse_digest_challenge (f.value)))
          break;
      }

      if (!c)
        return false;

      r.headers.set ("Authorization",
                     digest_authorization (*c,
                                           user,
                                           pass,
                                           r.method,
                                           parse_url (r.url).target,
                                           r.body ? *r.body : string (),
                                           random_hex (8)));
      return true;
    };
  }
}
