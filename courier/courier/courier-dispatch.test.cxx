#include <courier/courier-dispatch.hxx>

#include <string>
#include <memory>
#include <utility>
#include <cassert>
#include <filesystem>

#include <courier/http/http-error.hxx>
#include <courier/http/http-transport.test.hxx>

using namespace std;
using namespace courier;
namespace fs = std::filesystem;

namespace
{
  class fake_cognito: public cognito_authenticator
  {
  public:
    asio::awaitable<string>
    authenticate (const cognito_parameters& p) override
    {
      co_return "token-for-" + p.username;
    }
  };

  struct fixture
  {
    fs::path                  dir;
    test::scripted_transport  transport;
    static_workspace          workspace;
    fake_cognito              cognito;
    http_dispatcher           dispatcher;

    fixture ()
        : dir (scratch ()),
          dispatcher (transport, workspace, dir / "cookie.json", cognito)
    {
    }

    ~fixture ()
    {
      fs::remove_all (dir);
    }

    shared_ptr<http_response>
    send (const http_request& r,
          const courier_settings& s = {},
          shared_ptr<request_handle> h = nullptr)
    {
      return test::run (dispatcher.send (r, s, move (h)));
    }

    static fs::path
    scratch ()
    {
      fs::path d (fs::temp_directory_path () / "courier-dispatch-test");
      fs::remove_all (d);
      return d;
    }
  };

  test::scripted_response
  reply (uint16_t status, const string& type, string body)
  {
    test::scripted_response r;
    r.status = status;
    r.reason = status == 200 ? "OK" : "Not Found";
    r.headers.add ("Content-Type", type);
    r.chunks.push_back (move (body));
    return r;
  }
}

static void
test_send ()
{
  fixture f;

  test::scripted_response s (reply (200, "application/json", "{\"id\":1}"));
  s.headers.add ("Set-Cookie", "sid=abc; Path=/");
  f.transport.responses.push_back (move (s));

  http_request r (http_method::post, "https://api.example.com/items");
  r.headers.add ("Content-Type", "application/json");
  r.headers.add ("Authorization", "Basic alice:secret");
  r.body = http_request::body_type (string ("{}"));
  r.name = "create";

  shared_ptr<http_response> rs (f.send (r));

  assert (rs->status == 200);
  assert (rs->complete);
  assert (rs->body == "{\"id\":1}");
  assert (rs->body_size == 8);
  assert (rs->headers.get ("content-type") == "application/json");

  // The echo shows what went out with the caller's header names.
  //
  assert (rs->request.name == "create");
  assert (rs->request.headers.get ("Authorization") ==
          "Basic YWxpY2U6c2VjcmV0");
  assert (rs->request.headers.fields[0].name == "Content-Type");

  // The caller's request is untouched.
  //
  assert (r.headers.get ("Authorization") == "Basic alice:secret");

  // The cookie is remembered on disk and sent next time.
  //
  assert (fs::exists (f.dir / "cookie.json"));

  f.transport.responses.push_back (reply (404, "text/plain", "gone"));
  rs = f.send (http_request (http_method::get, "https://api.example.com/x"));

  assert (rs->status == 404);
  assert (rs->body == "gone");
  assert (f.transport.sent.back ().headers.get ("Cookie") == "sid=abc");

  // Not when remembering cookies is off.
  //
  courier_settings ns;
  ns.remember_cookies = false;

  f.transport.responses.push_back (reply (200, "text/plain", ""));
  f.send (http_request (http_method::get, "https://api.example.com/x"), ns);
  assert (!f.transport.sent.back ().headers.contains ("Cookie"));

  f.dispatcher.clear_cookies ();
  assert (!fs::exists (f.dir / "cookie.json"));

  f.transport.responses.push_back (reply (200, "text/plain", ""));
  f.send (http_request (http_method::get, "https://api.example.com/x"));
  assert (!f.transport.sent.back ().headers.contains ("Cookie"));
}

static void
test_event_stream ()
{
  fixture f;

  test::scripted_response s (reply (200, "text/event-stream", "data: 1\n\n"));
  s.chunks.push_back ("data: 2\n\n");
  s.yield = true;
  f.transport.responses.push_back (move (s));

  bool complete (true);
  shared_ptr<http_response> rs (
    test::run (
      [&f, &complete] () -> asio::awaitable<shared_ptr<http_response>>
      {
        shared_ptr<http_response> r (
          co_await f.dispatcher.send (
            http_request (http_method::get, "https://example.com/events"),
            courier_settings ()));

        complete = r->complete;
        co_return r;
      } ()));

  // Handed out on the head, finished in the background.
  //
  assert (!complete);
  assert (rs->complete);
  assert (rs->body == "data: 1\n\ndata: 2\n\n");

  // A stream breaking off after that only completes the result.
  //
  test::scripted_response b (reply (200, "text/event-stream", "data: 1\n\n"));
  b.yield = true;
  b.error = asio::error::connection_reset;
  f.transport.responses.push_back (move (b));

  rs = f.send (http_request (http_method::get, "https://example.com/events"));
  assert (rs->complete);
  assert (rs->body == "data: 1\n\n");
}

static void
test_failures ()
{
  fixture f;
  http_request r (http_method::get, "https://example.com/");

  // Connection failure.
  //
  try
  {
    f.send (r);
    assert (false);
  }
  catch (const network_error& e)
  {
    assert (!e.cancelled ());
  }

  // Failure mid-body of a regular response.
  //
  {
    test::scripted_response s (reply (200, "application/json", "{\"a\""));
    s.error = asio::error::connection_reset;
    f.transport.responses.push_back (move (s));

    try
    {
      f.send (r);
      assert (false);
    }
    catch (const network_error&) {}
  }

  // Cancelled before it went out.
  //
  {
    f.transport.responses.push_back (reply (200, "text/plain", "x"));
    f.transport.sent.clear ();

    auto h (make_shared<request_handle> ());
    h->cancel ();

    try
    {
      f.send (r, courier_settings (), h);
      assert (false);
    }
    catch (const network_error& e)
    {
      assert (e.cancelled ());
    }

    assert (f.transport.sent.empty ());
  }

  // Invalid URL and unresolvable authorization are caught before sending.
  //
  try
  {
    f.send (http_request (http_method::get, "example.com"));
    assert (false);
  }
  catch (const configuration_error&) {}

  try
  {
    http_request a (http_method::get, "https://example.com/");
    a.headers.add ("Authorization", "AWS onlykey x color:red");
    f.send (a);
    assert (false);
  }
  catch (const auth_resolution_error&) {}

  assert (f.transport.sent.empty ());
}

static void
test_auth ()
{
  fixture f;

  // Digest: the challenge is answered once.
  //
  {
    test::scripted_response c (reply (401, "text/plain", ""));
    c.headers.add ("WWW-Authenticate",
                   "Digest realm=\"r\", qop=\"auth\", nonce=\"n\"");

    f.transport.responses.push_back (move (c));
    f.transport.responses.push_back (reply (200, "text/plain", "welcome"));

    http_request r (http_method::get, "https://example.com/private");
    r.headers.add ("Authorization", "Digest alice secret");

    shared_ptr<http_response> rs (f.send (r));

    assert (rs->body == "welcome");
    assert (f.transport.sent.size () == 2);
    assert (!f.transport.sent[0].headers.contains ("Authorization"));
    assert (f.transport.sent[1].headers.get ("Authorization")->compare (
              0, 7, "Digest ") == 0);
  }

  // Cognito: signed in before sending.
  //
  {
    f.transport.responses.push_back (reply (200, "text/plain", ""));

    http_request r (http_method::get, "https://example.com/");
    r.headers.add ("Authorization", "Cognito bob pw us-east-1 pool client");

    f.send (r);
    assert (f.transport.sent.back ().headers.get ("Authorization") ==
            "token-for-bob");
  }
}

static void
test_decode ()
{
  fixture f;
  f.transport.responses.push_back (
    reply (200, "application/json; charset=latin1", "{\"n\":\"caf\xE9\\u00e9\"}"));

  courier_settings s;
  s.decode_escaped_unicode = true;

  shared_ptr<http_response> rs (
    f.send (http_request (http_method::get, "https://example.com/"), s));

  assert (rs->body == "{\"n\":\"caf\xC3\xA9\xC3\xA9\"}");
  assert (rs->body_size == 18);
}

int
main ()
{
  test_send ();
  test_event_stream ();
  test_failures ();
  test_auth ();
  test_decode ();
}
