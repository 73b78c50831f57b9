#include <courier/response/response-consumer.hxx>

#include <string>
#include <memory>
#include <future>
#include <cassert>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

using namespace std;
using namespace courier;

static response_metadata
head (const string& content_type)
{
  response_metadata m;
  m.status = 200;
  m.reason = "OK";
  m.headers.add ("Content-Type", content_type);
  return m;
}

static transport_request
sent ()
{
  transport_request r;
  r.method = http_method::post;
  r.url = "https://example.com/items";
  r.headers.add ("content-type", "application/json");
  r.headers.add ("x-trace", "1");
  r.headers.add ("host", "example.com");
  r.body = "{}";
  return r;
}

static http_request
logical ()
{
  http_request r (http_method::post, "https://example.com/items");
  r.headers.add ("Content-Type", "application/json");
  r.headers.add ("X-Trace", "1");
  r.body = http_request::body_type (string ("{}"));
  r.raw_body = "{}";
  r.name = "create item";
  return r;
}

static void
test_chunks ()
{
  asio::io_context ioc;
  response_consumer c (ioc.get_executor (), logical (), nullptr, false);

  c.on_response (head ("text/plain; charset=utf8"), sent ());
  const http_response& r (*c.response ());

  c.on_data ("caf", 3);
  assert (r.body == "caf");
  assert (r.body_size == 3);

  c.on_data ("\xC3\xA9", 2);
  assert (r.body == "caf\xC3\xA9");
  assert (r.body_size == 5);
  assert (r.body_buffer == "caf\xC3\xA9");

  assert (!c.settled ());
  c.on_end (timing_phases ());
  assert (c.settled ());
  assert (r.complete);
}

static void
test_unescape ()
{
  asio::io_context ioc;
  response_consumer c (ioc.get_executor (), logical (), nullptr, true);

  c.on_response (head ("application/json"), sent ());
  c.on_data ("{\"n\":\"caf\\u00", 13);
  c.on_data ("e9 \\u0022\"}", 11);
  c.on_end (timing_phases ());

  const http_response& r (*c.response ());
  assert (r.body == "{\"n\":\"caf\xC3\xA9 \\\"\"}");
  assert (r.body_buffer == "{\"n\":\"caf\\u00e9 \\u0022\"}");
}

static void
test_head ()
{
  asio::io_context ioc;
  auto h (make_shared<request_handle> ());
  response_consumer c (ioc.get_executor (), logical (), h, false);

  response_metadata m;
  m.status = 404;
  m.reason = "Not Found";
  m.version = http_version (1, 0);
  m.headers.add ("Content-Type", "text/plain");
  m.headers.add ("X-Foo", "b");
  m.headers.add ("x-foo", "c");
  m.headers.add ("Set-Cookie", "a=1");
  m.headers.add ("set-cookie", "b=2");

  c.on_response (m, sent ());
  const http_response& r (*c.response ());

  assert (r.status == 404);
  assert (r.reason == "Not Found");
  assert (r.version == http_version (1, 0));
  assert (r.raw == h);

  // (12 + 10) + (5 + 1) + (5 + 1) + (10 + 3) + (10 + 3) + 5 lines.
  //
  assert (r.headers_size == 65);

  // First-seen case wins, repeats merge except Set-Cookie.
  //
  assert (r.headers.size () == 4);
  assert (r.headers.fields[0].name == "Content-Type");
  assert (r.headers.fields[1].name == "X-Foo");
  assert (r.headers.fields[1].value == "b, c");
  assert (r.headers.fields[2] == http_field ("Set-Cookie", "a=1"));
  assert (r.headers.fields[3] == http_field ("Set-Cookie", "b=2"));

  // The echo carries the names the caller used.
  //
  const http_request& q (r.request);
  assert (q.method == http_method::post);
  assert (q.url == "https://example.com/items");
  assert (q.headers.size () == 3);
  assert (q.headers.fields[0].name == "Content-Type");
  assert (q.headers.fields[1].name == "X-Trace");
  assert (q.headers.fields[2].name == "host");
  assert (q.raw_body == "{}");
  assert (q.name == "create item");

  shared_ptr<byte_source> b (q.stream_body ());
  assert (b != nullptr);
  assert (static_cast<memory_source&> (*b).data () == "{}");
}

// Run wait() on the consumer's own io_context.
//
static shared_ptr<http_response>
wait (asio::io_context& ioc, response_consumer& c)
{
  future<shared_ptr<http_response>> f (
    asio::co_spawn (ioc, c.wait (), asio::use_future));

  ioc.restart ();
  ioc.run ();
  return f.get ();
}

static void
test_resolution ()
{
  // Event stream resolves on the head and keeps growing.
  //
  {
    asio::io_context ioc;
    response_consumer c (ioc.get_executor (), logical (), nullptr, false);

    c.on_response (head ("text/event-stream; charset=utf-8"), sent ());
    assert (c.settled ());

    shared_ptr<http_response> r (wait (ioc, c));
    assert (!r->complete);

    c.on_data ("data: 1\n\n", 9);
    assert (r->body == "data: 1\n\n");

    c.on_end (timing_phases ());
    assert (r->complete);

    // A late failure only ends the stream.
    //
    assert (!c.fail (make_exception_ptr (runtime_error ("reset"))));
  }

  // Anything else resolves at the end.
  //
  {
    asio::io_context ioc;
    response_consumer c (ioc.get_executor (), logical (), nullptr, false);

    c.on_response (head ("application/json"), sent ());
    assert (!c.settled ());

    c.on_data ("{}", 2);
    assert (!c.settled ());

    c.on_end (timing_phases ());
    assert (c.settled ());
    assert (wait (ioc, c)->body == "{}");
  }

  // Waiting before anything happens.
  //
  {
    asio::io_context ioc;
    response_consumer c (ioc.get_executor (), logical (), nullptr, false);

    future<shared_ptr<http_response>> f (
      asio::co_spawn (ioc, c.wait (), asio::use_future));

    asio::co_spawn (
      ioc,
      [&c] () -> asio::awaitable<void>
      {
        c.on_response (head ("text/plain"), sent ());
        c.on_data ("ok", 2);
        c.on_end (timing_phases ());
        co_return;
      },
      asio::detached);

    ioc.run ();
    assert (f.get ()->body == "ok");
  }

  // Rejection.
  //
  {
    asio::io_context ioc;
    response_consumer c (ioc.get_executor (), logical (), nullptr, false);

    assert (c.fail (make_exception_ptr (runtime_error ("refused"))));
    assert (c.settled ());

    try
    {
      wait (ioc, c);
      assert (false);
    }
    catch (const runtime_error& e)
    {
      assert (string (e.what ()) == "refused");
    }
  }
}

int
main ()
{
  test_chunks ();
  test_unescape ();
  test_head ();
  test_resolution ();
}
