#include <courier/cert/cert-resolver.hxx>

#include <string>
#include <fstream>
#include <cassert>
#include <filesystem>

using namespace std;
using namespace courier;
namespace fs = std::filesystem;

static fs::path
scratch ()
{
  fs::path d (fs::temp_directory_path () / "courier-cert-resolver-test");
  fs::remove_all (d);
  fs::create_directories (d / "certs");
  fs::create_directories (d / "requests");
  return d;
}

static void
write (const fs::path& p, const string& s)
{
  ofstream ofs (p, ios::binary);
  ofs << s;
}

static void
test_lookup ()
{
  fs::path d (scratch ());
  write (d / "certs" / "client.pem", "CERT");
  write (d / "certs" / "client.key", "KEY");

  courier_settings s;
  s.host_certificates["example.com:8443"] = certificate_config {
    (d / "certs" / "client.pem").string (),
    (d / "certs" / "client.key").string (),
    nullopt,
    string ("secret")};

  static_workspace w;
  certificate_resolver r (w);

  // The key is host[:port] verbatim: no default port normalization.
  //
  assert (!r.resolve ("https://example.com/", s));
  assert (!r.resolve ("https://example.com:443/", s));
  assert (!r.resolve ("https://other.com:8443/", s));

  optional<client_certificate> c (r.resolve ("https://example.com:8443/x", s));
  assert (c);
  assert (c->cert == "CERT");
  assert (c->key == "KEY");
  assert (!c->pfx);
  assert (c->passphrase == "secret");

  fs::remove_all (d);
}

static void
test_relative ()
{
  fs::path d (scratch ());
  write (d / "certs" / "client.pfx", "PFX");
  write (d / "requests" / "local.pfx", "LOCAL");

  // Workspace root takes precedence.
  //
  {
    static_workspace w (d, d / "requests" / "api.http");
    certificate_resolver r (w);

    assert (r.load (string ("certs/client.pfx")) == "PFX");
    assert (!r.load (string ("local.pfx")));
  }

  // Then the directory of the current file.
  //
  {
    static_workspace w (nullopt, d / "requests" / "api.http");
    certificate_resolver r (w);

    assert (r.load (string ("local.pfx")) == "LOCAL");
    assert (r.load (string ("../certs/client.pfx")) == "PFX");
  }

  // Neither is known.
  //
  {
    static_workspace w;
    certificate_resolver r (w);

    assert (!r.load (string ("certs/client.pfx")));
    assert (!r.load (nullopt));
  }

  fs::remove_all (d);
}

static void
test_missing ()
{
  fs::path d (scratch ());

  courier_settings s;
  s.host_certificates["localhost"].cert = (d / "nope.pem").string ();
  s.host_certificates["localhost"].pfx = "nope.pfx";

  static_workspace w (d, nullopt);
  certificate_resolver r (w);

  // Missing files are warnings: the entry still resolves, just empty.
  //
  optional<client_certificate> c (r.resolve ("https://localhost/", s));
  assert (c);
  assert (c->empty ());

  fs::remove_all (d);
}

int
main ()
{
  test_lookup ();
  test_relative ();
  test_missing ();
}
