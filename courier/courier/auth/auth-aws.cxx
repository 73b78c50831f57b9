#include <courier/auth/auth-aws.hxx>

#include <map>
#include <ctime>
#include <cctype>
#include <vector>
#include <sstream>
#include <utility>
#include <algorithm>

#include <courier/http/http-url.hxx>
#include <courier/http/http-error.hxx>
#include <courier/auth/auth-crypto.hxx>

using namespace std;

namespace courier
{
  aws_credentials
  parse_aws_authorization (const string& line)
  {
    istringstream is (line);
    vector<string> ts;
    for (string t; is >> t; )
      ts.push_back (move (t));

    if (ts.size () < 3 || !iequals (ts[0], "aws"))
      throw auth_resolution_error (
        "invalid AWS authorization: expected "
        "'AWS <accessKeyId> <secretAccessKey> [token:...] [region:...] "
        "[service:...]'");

    aws_credentials r;
    r.access_key_id = ts[1];
    r.secret_access_key = ts[2];

    for (size_t i (3); i < ts.size (); ++i)
    {
      const string& t (ts[i]);
      size_t c (t.find (':'));

      if (c == string::npos)
        throw auth_resolution_error ("invalid AWS authorization parameter '" +
                                     t + "'");

      string n (to_lower (t.substr (0, c)));
      string v (t.substr (c + 1));

      if      (n == "token")   r.session_token = move (v);
      else if (n == "region")  r.region = move (v);
      else if (n == "service") r.service = move (v);
      else
        throw auth_resolution_error ("unknown AWS authorization parameter '" +
                                     n + "'");
    }

    return r;
  }

  // RFC 3986 encoding: everything but unreserved characters is escaped.
  //
  static string
  uri_encode (const string& s)
  {
    static const char x[] = "0123456789ABCDEF";

    string r;
    for (unsigned char c: s)
    {
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        r += static_cast<char> (c);
      else
      {
        r += '%';
        r += x[c >> 4];
        r += x[c & 0x0f];
      }
    }

    return r;
  }

  static string
  uri_decode (const string& s)
  {
    string r;
    for (size_t i (0); i < s.size (); ++i)
    {
      if (s[i] == '%' && i + 2 < s.size () &&
          isxdigit (static_cast<unsigned char> (s[i + 1])) &&
          isxdigit (static_cast<unsigned char> (s[i + 2])))
      {
        r += static_cast<char> (stoi (s.substr (i + 1, 2), nullptr, 16));
        i += 2;
      }
      else
        r += s[i];
    }

    return r;
  }

  // Canonical URI. Each segment is decoded and re-encoded so that the result
  // does not depend on how the caller escaped the path. Every service but s3
  // also expects the dot segments and empty segments to be folded.
  //
  static string
  canonical_uri (const string& path, bool s3)
  {
    vector<string> segs;
    for (size_t b (1); b <= path.size (); )
    {
      size_t e (path.find ('/', b));
      string s (path.substr (b, e == string::npos ? string::npos : e - b));

      if (!s3 && s == "..")
      {
        if (!segs.empty ())
          segs.pop_back ();
      }
      else if (s3 || (s != "." && !(s.empty () && e != string::npos)))
        segs.push_back (move (s));

      if (e == string::npos)
        break;

      b = e + 1;
    }

    string r;
    for (const string& s: segs)
    {
      r += '/';
      r += uri_encode (uri_decode (s));
    }

    return r.empty () ? "/" : r;
  }

  static string
  canonical_query (const string& q)
  {
    vector<pair<string, string>> ps;

    for (size_t b (0); b < q.size (); )
    {
      size_t e (q.find ('&', b));
      string p (q.substr (b, e == string::npos ? string::npos : e - b));

      if (!p.empty ())
      {
        size_t eq (p.find ('='));
        ps.emplace_back (
          uri_encode (uri_decode (p.substr (0, eq))),
          eq != string::npos ? uri_encode (uri_decode (p.substr (eq + 1)))
                             : string ());
      }

      if (e == string::npos)
        break;

      b = e + 1;
    }

    sort (ps.begin (), ps.end ());

    string r;
    for (const auto& p: ps)
    {
      if (!r.empty ())
        r += '&';

      r += p.first + '=' + p.second;
    }

    return r;
  }

  // Trim and collapse sequential spaces.
  //
  static string
  canonical_value (const string& v)
  {
    string r;
    bool sp (false);

    for (char c: v)
    {
      if (c == ' ' || c == '\t')
        sp = !r.empty ();
      else
      {
        if (sp)
          r += ' ';

        r += c;
        sp = false;
      }
    }

    return r;
  }

  // Infer service and region from an AWS host name such as
  // service.region.amazonaws.com or service-region.amazonaws.com.
  //
  static pair<string, string>
  infer_scope (const string& host)
  {
    string h (host);
    for (const char* sfx: {".amazonaws.com.cn", ".amazonaws.com"})
    {
      string s (sfx);
      if (h.size () > s.size () &&
          h.compare (h.size () - s.size (), s.size (), s) == 0)
      {
        h.erase (h.size () - s.size ());

        vector<string> ls;
        for (size_t b (0); ; )
        {
          size_t e (h.find ('.', b));
          ls.push_back (h.substr (b, e == string::npos ? string::npos : e - b));

          if (e == string::npos)
            break;

          b = e + 1;
        }

        string svc, rgn;
        if (ls.size () == 1)
          svc = ls[0];
        else
        {
          svc = ls[ls.size () - 2];
          rgn = ls[ls.size () - 1];
        }

        // Legacy dash-separated form, e.g., s3-us-west-2.
        //
        if (rgn.empty ())
        {
          if (size_t d = svc.find ('-'); d != string::npos &&
              svc.compare (0, 2, "s3") == 0)
          {
            rgn = svc.substr (d + 1);
            svc = svc.substr (0, d);
          }
        }

        return {svc, rgn};
      }
    }

    return {};
  }

  void
  sign_aws_v4 (transport_request& r,
               const aws_credentials& c,
               chrono::system_clock::time_point t)
  {
    url_parts u (parse_url (r.url));

    auto [isvc, irgn] (infer_scope (u.host));

    string svc (c.service ? *c.service : isvc);
    string rgn (c.region ? *c.region : irgn);

    if (svc.empty ())
      throw auth_resolution_error (
        "unable to determine AWS service for host " + u.host +
        ", specify service:<name> in the authorization");

    if (rgn.empty ())
      rgn = "us-east-1";

    bool s3 (svc == "s3");

    time_t tt (chrono::system_clock::to_time_t (t));
    tm gt;
    gmtime_r (&tt, &gt);

    char dt[17];
    char d[9];
    strftime (dt, sizeof (dt), "%Y%m%dT%H%M%SZ", &gt);
    strftime (d, sizeof (d), "%Y%m%d", &gt);

    string payload (sha256_hex (r.body ? *r.body : string ()));

    r.headers.set ("X-Amz-Date", dt);

    if (c.session_token)
      r.headers.set ("X-Amz-Security-Token", *c.session_token);

    if (s3)
      r.headers.set ("X-Amz-Content-Sha256", payload);

    // Canonical headers: lower-case names, sorted, multiple values joined
    // with commas. Host comes from the URL unless explicitly set.
    //
    static const char* unsigned_headers[] = {
      "authorization", "connection", "x-amzn-trace-id", "user-agent",
      "expect", "presigned-expires", "range"};

    map<string, string> hs;
    for (const http_field& f: r.headers)
    {
      string n (to_lower (f.name));

      if (find (begin (unsigned_headers), end (unsigned_headers), n) !=
          end (unsigned_headers))
        continue;

      string v (canonical_value (f.value));
      auto i (hs.find (n));

      if (i == hs.end ())
        hs.emplace (move (n), move (v));
      else
        i->second += ',' + v;
    }

    if (hs.find ("host") == hs.end ())
      hs.emplace ("host", u.authority ());

    string ch, sh;
    for (const auto& h: hs)
    {
      ch += h.first + ':' + h.second + '\n';

      if (!sh.empty ())
        sh += ';';

      sh += h.first;
    }

    string creq (to_string (r.method) + '\n' +
                 canonical_uri (u.path (), s3) + '\n' +
                 canonical_query (u.query ()) + '\n' +
                 ch + '\n' +
                 sh + '\n' +
                 payload);

    string scope (string (d) + '/' + rgn + '/' + svc + "/aws4_request");

    string sts ("AWS4-HMAC-SHA256\n" +
                string (dt) + '\n' +
                scope + '\n' +
                sha256_hex (creq));

    string k (hmac_sha256 ("AWS4" + c.secret_access_key, d));
    k = hmac_sha256 (k, rgn);
    k = hmac_sha256 (k, svc);
    k = hmac_sha256 (k, "aws4_request");

    string sig (to_hex (hmac_sha256 (k, sts)));

    r.headers.set ("Authorization",
                   "AWS4-HMAC-SHA256 Credential=" + c.access_key_id + '/' +
                   scope + ", SignedHeaders=" + sh + ", Signature=" + sig);
  }

  before_request_hook
  aws_signature_hook (const string& authorization)
  {
    // Parse eagerly so that a malformed line fails the preparation rather
    // than the send.
    //
    aws_credentials c (parse_aws_authorization (authorization));

    return [c = move (c)] (transport_request& r)
    {
      sign_aws_v4 (r, c, chrono::system_clock::now ());
    };
  }
}
