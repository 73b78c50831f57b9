#include <courier/http/http-url.hxx>

#include <string>
#include <cassert>

#include <courier/http/http-error.hxx>

using namespace std;
using namespace courier;

static bool
invalid (const string& u)
{
  try
  {
    parse_url (u);
  }
  catch (const configuration_error&)
  {
    return true;
  }

  return false;
}

static void
test_parse ()
{
  {
    url_parts u (parse_url ("https://API.Example.com/v1/items?id=3#top"));
    assert (u.scheme == "https");
    assert (u.host == "api.example.com");
    assert (u.port.empty ());
    assert (u.target == "/v1/items?id=3");
    assert (u.path () == "/v1/items");
    assert (u.query () == "id=3");
    assert (u.effective_port () == 443);
    assert (u.secure ());
    assert (u.authority () == "api.example.com");
  }

  // The port is kept verbatim, even if it is the default one.
  //
  {
    url_parts u (parse_url ("http://user:pw@internal.example.com:80"));
    assert (u.host == "internal.example.com");
    assert (u.port == "80");
    assert (u.target == "/");
    assert (u.authority () == "internal.example.com:80");
  }

  {
    url_parts u (parse_url ("http://[::1]:8080/x"));
    assert (u.host == "::1");
    assert (u.port == "8080");
    assert (u.authority () == "[::1]:8080");
  }

  {
    url_parts u (parse_url ("http://h?x=1"));
    assert (u.target == "/?x=1");
  }

  assert (invalid ("example.com/path"));
  assert (invalid ("http://"));
  assert (invalid ("http://host:port/"));
  assert (invalid ("http://host:70000/"));
  assert (invalid ("ht tp://host/"));
  assert (invalid ("http://[::1/"));
}

static void
test_encode ()
{
  assert (encode_url ("http://h/a b") == "http://h/a%20b");
  assert (encode_url ("http://h/a%20b") == "http://h/a%20b");
  assert (encode_url ("http://h/100%") == "http://h/100%25");
  assert (encode_url ("http://h/?q=caf\xC3\xA9") == "http://h/?q=caf%C3%A9");
  assert (encode_url ("http://h/p?a=1&b=[x]") == "http://h/p?a=1&b=[x]");
}

static void
test_resolve ()
{
  const string b ("http://h:81/a/b/c?q=1");

  assert (resolve_url (b, "https://other/x") == "https://other/x");
  assert (resolve_url (b, "//cdn.example.com/f") == "http://cdn.example.com/f");
  assert (resolve_url (b, "/root") == "http://h:81/root");
  assert (resolve_url (b, "?z=2") == "http://h:81/a/b/c?z=2");
  assert (resolve_url (b, "d") == "http://h:81/a/b/d");
  assert (resolve_url (b, "../d?k=v") == "http://h:81/a/d?k=v");
  assert (resolve_url (b, "./") == "http://h:81/a/b/");
  assert (resolve_url (b, "../../../x") == "http://h:81/x");
}

int
main ()
{
  test_parse ();
  test_encode ();
  test_resolve ();
}
