#include <courier/proxy/proxy-resolver.hxx>

#include <set>
#include <iostream>

#include <courier/http/http-url.hxx>
#include <courier/http/http-error.hxx>

using namespace std;

namespace courier
{
  bool
  ignore_proxy (const string& url, const vector<string>& exclude)
  {
    if (exclude.empty ())
      return false;

    url_parts u (parse_url (url));

    set<string> es;
    for (const string& e: exclude)
      es.insert (to_lower (e));

    for (const string& e: es)
    {
      size_t c (e.find (':'));
      string h (e.substr (0, c));

      if (u.port.empty ())
      {
        if (c == string::npos && h == u.host)
          return true;
      }
      else
      {
        // Anything past a second colon is not part of the port.
        //
        string p;
        if (c != string::npos)
          p = e.substr (c + 1, e.find (':', c + 1) - c - 1);

        if (h == u.host && (p.empty () || p == u.port))
          return true;
      }
    }

    return false;
  }

  void proxy_resolver::
  resolve (transport_options& o,
           const string& url,
           const courier_settings& s) const
  {
    if (s.proxy.empty () || ignore_proxy (url, s.exclude_hosts_for_proxy))
      return;

    url_parts p;
    try
    {
      p = parse_url (s.proxy);
    }
    catch (const configuration_error& e)
    {
      cerr << "warning: ignoring proxy " << s.proxy << ": " << e.what ()
           << endl;
      return;
    }

    if (p.scheme != "http" && p.scheme != "https")
    {
      cerr << "warning: ignoring proxy " << s.proxy << ": unsupported scheme "
           << p.scheme << endl;
      return;
    }

    proxy_agent a;
    a.scheme = p.scheme;
    a.host = p.host;
    a.port = p.effective_port ();
    a.strict_ssl = s.proxy_strict_ssl;
    a.kind = parse_url (url).secure ()
      ? proxy_agent::mode::tunnel
      : proxy_agent::mode::forward;

    if (verbose_)
      cout << "using proxy " << a.scheme << "://" << a.host << ':' << a.port
           << (a.kind == proxy_agent::mode::tunnel ? " (tunnel)" : "")
           << endl;

    o.agent = move (a);
  }
}
