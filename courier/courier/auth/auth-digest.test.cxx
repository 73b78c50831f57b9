#include <courier/auth/auth-digest.hxx>

#include <string>
#include <cassert>

using namespace std;
using namespace courier;

static const string rfc_challenge (
  "Digest realm=\"testrealm@host.com\", qop=\"auth,auth-int\", "
  "nonce=\"dcd98b7102dd2f0e8b11d0f600bfb0c093\", "
  "opaque=\"5ccc069c403ebaf9f0171e9517f40e41\"");

static bool
contains (const string& s, const string& x)
{
  return s.find (x) != string::npos;
}

static void
test_parse ()
{
  optional<digest_challenge> c (parse_digest_challenge (rfc_challenge));
  assert (c);
  assert (c->realm == "testrealm@host.com");
  assert (c->nonce == "dcd98b7102dd2f0e8b11d0f600bfb0c093");
  assert (c->opaque == "5ccc069c403ebaf9f0171e9517f40e41");
  assert (c->qop == "auth,auth-int");
  assert (c->algorithm == "MD5");

  assert (!parse_digest_challenge ("Basic realm=\"x\""));
  assert (!parse_digest_challenge ("Digest realm=\"x\""));
  assert (!parse_digest_challenge ("DigestX nonce=\"n\""));
  assert (parse_digest_challenge ("digest nonce=abc")->nonce == "abc");
}

// RFC 2617, section 3.5.
//
static void
test_rfc2617 ()
{
  digest_challenge c (*parse_digest_challenge (rfc_challenge));

  string a (digest_authorization (c,
                                  "Mufasa",
                                  "Circle Of Life",
                                  http_method::get,
                                  "/dir/index.html",
                                  "",
                                  "0a4f113b"));

  assert (a.compare (0, 7, "Digest ") == 0);
  assert (contains (a, "username=\"Mufasa\""));
  assert (contains (a, "uri=\"/dir/index.html\""));
  assert (contains (a, "qop=auth,"));
  assert (contains (a, "nc=00000001"));
  assert (contains (a, "cnonce=\"0a4f113b\""));
  assert (contains (a, "opaque=\"5ccc069c403ebaf9f0171e9517f40e41\""));
  assert (contains (a, "response=\"6629fae49393a05397450978507c4ef1\""));
}

static void
test_variants ()
{
  digest_challenge c;
  c.realm = "r";
  c.nonce = "n";
  c.algorithm = "MD5";

  // Without qop the legacy response omits nc and cnonce.
  //
  string l (digest_authorization (c, "u", "p", http_method::get, "/", "", "cn"));
  assert (!contains (l, "qop="));
  assert (!contains (l, "cnonce="));

  // MD5-sess and auth-int change the response.
  //
  c.qop = "auth";
  string a (digest_authorization (c, "u", "p", http_method::post, "/", "b", "cn"));

  c.algorithm = "MD5-sess";
  string s (digest_authorization (c, "u", "p", http_method::post, "/", "b", "cn"));
  assert (contains (s, "algorithm=MD5-sess"));
  assert (a.substr (a.find ("response=")) != s.substr (s.find ("response=")));

  c.algorithm = "MD5";
  c.qop = "auth-int";
  string i1 (digest_authorization (c, "u", "p", http_method::post, "/", "b1", "cn"));
  string i2 (digest_authorization (c, "u", "p", http_method::post, "/", "b2", "cn"));
  assert (contains (i1, "qop=auth-int"));
  assert (i1 != i2);
}

static void
test_hook ()
{
  after_response_hook h (digest_hook ("Mufasa", "Circle Of Life"));

  transport_request r;
  r.method = http_method::get;
  r.url = "http://www.example.com/dir/index.html?x=1";

  // Anything but 401 is left alone.
  //
  {
    response_metadata m;
    m.status = 200;
    m.headers.add ("WWW-Authenticate", rfc_challenge);

    assert (!h (m, r));
    assert (!r.headers.contains ("Authorization"));
  }

  // A 401 without a Digest challenge is not answered.
  //
  {
    response_metadata m;
    m.status = 401;
    m.headers.add ("WWW-Authenticate", "Basic realm=\"x\"");

    assert (!h (m, r));
  }

  {
    response_metadata m;
    m.status = 401;
    m.headers.add ("www-authenticate", "Basic realm=\"x\"");
    m.headers.add ("WWW-Authenticate", rfc_challenge);

    assert (h (m, r));

    optional<string> a (r.headers.get ("authorization"));
    assert (a);
    assert (contains (*a, "uri=\"/dir/index.html?x=1\""));
    assert (contains (*a, "username=\"Mufasa\""));
  }
}

int
main ()
{
  test_parse ();
  test_rfc2617 ();
  test_variants ();
  test_hook ();
}
