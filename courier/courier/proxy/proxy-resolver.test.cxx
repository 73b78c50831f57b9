#include <courier/proxy/proxy-resolver.hxx>

#include <string>
#include <vector>
#include <cassert>

using namespace std;
using namespace courier;

static void
test_ignore ()
{
  assert (ignore_proxy ("http://internal.example.com/x",
                        {"internal.example.com"}));
  assert (!ignore_proxy ("http://internal.example.com:8080/x",
                         {"internal.example.com:9090"}));
  assert (!ignore_proxy ("http://a.com", {}));

  // Case-insensitive, and duplicates do not matter.
  //
  assert (ignore_proxy ("http://Internal.Example.com/",
                        {"INTERNAL.example.COM", "internal.example.com"}));

  // Without a port in the URL only bare hosts match.
  //
  assert (!ignore_proxy ("http://localhost/", {"localhost:80"}));

  // With a port in the URL a bare host or the same port matches.
  //
  assert (ignore_proxy ("http://localhost:8080/", {"localhost"}));
  assert (ignore_proxy ("http://localhost:8080/", {"other", "localhost:8080"}));
  assert (!ignore_proxy ("http://localhost:8080/", {"localhost:80"}));

  // No suffix or wildcard matching.
  //
  assert (!ignore_proxy ("http://api.example.com/", {"example.com"}));
}

static courier_settings
proxied (const string& proxy)
{
  courier_settings s;
  s.proxy = proxy;
  s.exclude_hosts_for_proxy = {"localhost"};
  return s;
}

static void
test_resolve ()
{
  proxy_resolver r;

  // Not configured.
  //
  {
    transport_options o;
    r.resolve (o, "http://example.com/", courier_settings ());
    assert (!o.agent);
  }

  // Excluded.
  //
  {
    transport_options o;
    r.resolve (o, "http://localhost/", proxied ("http://proxy:3128"));
    assert (!o.agent);
  }

  // Plain target is forwarded.
  //
  {
    transport_options o;
    r.resolve (o, "http://example.com/", proxied ("http://proxy:3128"));

    assert (o.agent);
    assert (o.agent->scheme == "http");
    assert (o.agent->host == "proxy");
    assert (o.agent->port == 3128);
    assert (!o.agent->strict_ssl);
    assert (o.agent->kind == proxy_agent::mode::forward);
  }

  // TLS target is tunneled; the proxy port defaults by its scheme.
  //
  {
    courier_settings s (proxied ("https://Proxy.corp"));
    s.proxy_strict_ssl = true;

    transport_options o;
    r.resolve (o, "https://example.com/", s);

    assert (o.agent);
    assert (o.agent->scheme == "https");
    assert (o.agent->host == "proxy.corp");
    assert (o.agent->port == 443);
    assert (o.agent->strict_ssl);
    assert (o.agent->kind == proxy_agent::mode::tunnel);
  }

  // Unsupported or invalid proxy URLs are ignored.
  //
  {
    transport_options o;
    r.resolve (o, "http://example.com/", proxied ("socks5://proxy:1080"));
    assert (!o.agent);

    r.resolve (o, "http://example.com/", proxied ("proxy:3128"));
    assert (!o.agent);
  }
}

int
main ()
{
  test_ignore ();
  test_resolve ();
}
