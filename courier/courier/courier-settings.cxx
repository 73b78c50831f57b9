#include <courier/courier-settings.hxx>

#include <fstream>
#include <sstream>
#include <utility>

#include <boost/json.hpp>

#include <courier/http/http-types.hxx>
#include <courier/http/http-error.hxx>

using namespace std;

namespace courier
{
  namespace json = boost::json;

  namespace
  {
    enum class setting
    {
      unknown,
      timeout,
      follow_redirect,
      proxy,
      exclude_hosts,
      proxy_strict_ssl,
      remember_cookies,
      decode_unicode,
      certificates
    };

    setting
    classify (string k)
    {
      k = to_lower (move (k));

      for (const char* p: {"rest-client.", "http."})
      {
        string s (p);
        if (k.compare (0, s.size (), s) == 0)
        {
          k.erase (0, s.size ());
          break;
        }
      }

      if (k == "timeoutms" || k == "timeoutinmilliseconds")
        return setting::timeout;
      if (k == "followredirect")
        return setting::follow_redirect;
      if (k == "proxy")
        return setting::proxy;
      if (k == "excludehostsforproxy")
        return setting::exclude_hosts;
      if (k == "proxystrictssl")
        return setting::proxy_strict_ssl;
      if (k == "remembercookiesforsubsequentrequests")
        return setting::remember_cookies;
      if (k == "decodeescapedunicodecharacters")
        return setting::decode_unicode;
      if (k == "hostcertificates" || k == "certificates")
        return setting::certificates;

      return setting::unknown;
    }

    [[noreturn]] void
    mistyped (const string& k, const char* what)
    {
      throw configuration_error ("invalid value for setting '" + k +
                                 "': expected " + what);
    }

    bool
    as_bool (const string& k, const json::value& v)
    {
      if (!v.is_bool ())
        mistyped (k, "boolean");

      return v.get_bool ();
    }

    string
    as_string (const string& k, const json::value& v)
    {
      if (!v.is_string ())
        mistyped (k, "string");

      return string (v.get_string ());
    }

    optional<string>
    as_optional_string (const string& k, const json::object& o, const char* n)
    {
      const json::value* v (o.if_contains (n));

      if (v == nullptr || v->is_null ())
        return nullopt;

      return as_string (k + '.' + n, *v);
    }
  }

  courier_settings
  parse_settings (const string& text)
  {
    boost::system::error_code ec;
    json::value doc (json::parse (text, ec));

    if (ec)
      throw configuration_error ("invalid settings: " + ec.message ());

    if (!doc.is_object ())
      throw configuration_error ("invalid settings: expected JSON object");

    courier_settings r;

    for (const json::key_value_pair& kv: doc.get_object ())
    {
      string k (kv.key ());
      const json::value& v (kv.value ());

      switch (classify (k))
      {
      case setting::timeout:
        {
          if (v.is_int64 ())
            r.timeout_ms = v.get_int64 ();
          else if (v.is_uint64 ())
            r.timeout_ms = static_cast<int64_t> (v.get_uint64 ());
          else if (v.is_double ())
            r.timeout_ms = static_cast<int64_t> (v.get_double ());
          else
            mistyped (k, "number");
          break;
        }
      case setting::follow_redirect:
        r.follow_redirect = as_bool (k, v);
        break;
      case setting::proxy:
        r.proxy = v.is_null () ? string () : as_string (k, v);
        break;
      case setting::exclude_hosts:
        {
          if (!v.is_array ())
            mistyped (k, "array of strings");

          for (const json::value& e: v.get_array ())
            r.exclude_hosts_for_proxy.push_back (as_string (k, e));
          break;
        }
      case setting::proxy_strict_ssl:
        r.proxy_strict_ssl = as_bool (k, v);
        break;
      case setting::remember_cookies:
        r.remember_cookies = as_bool (k, v);
        break;
      case setting::decode_unicode:
        r.decode_escaped_unicode = as_bool (k, v);
        break;
      case setting::certificates:
        {
          if (!v.is_object ())
            mistyped (k, "object");

          for (const json::key_value_pair& h: v.get_object ())
          {
            string hk (k + '.' + string (h.key ()));

            if (!h.value ().is_object ())
              mistyped (hk, "object");

            const json::object& o (h.value ().get_object ());

            certificate_config c;
            c.cert       = as_optional_string (hk, o, "cert");
            c.key        = as_optional_string (hk, o, "key");
            c.pfx        = as_optional_string (hk, o, "pfx");
            c.passphrase = as_optional_string (hk, o, "passphrase");

            r.host_certificates[string (h.key ())] = move (c);
          }
          break;
        }
      case setting::unknown:
        break;
      }
    }

    return r;
  }

  courier_settings
  load_settings (const fs::path& p)
  {
    ifstream ifs (p, ios::binary);

    if (!ifs)
      throw configuration_error ("unable to open settings file " +
                                 p.string ());

    ostringstream os;
    os << ifs.rdbuf ();

    try
    {
      return parse_settings (os.str ());
    }
    catch (const configuration_error& e)
    {
      throw configuration_error (p.string () + ": " + e.what ());
    }
  }
}
