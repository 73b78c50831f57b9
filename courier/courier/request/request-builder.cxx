#include <courier/request/request-builder.hxx>

#include <chrono>

#include <courier/http/http-url.hxx>
#include <courier/cookie/cookie-jar.hxx>

using namespace std;

namespace courier
{
  asio::awaitable<transport_options> request_builder::
  prepare (const http_request& r, const courier_settings& s) const
  {
    transport_options o;
    o.method = r.method;
    o.url = encode_url (r.url);

    // Validate early, before any I/O.
    //
    parse_url (o.url);

    if (const string* b = r.string_body ())
      o.body = *b;
    else if (shared_ptr<byte_source> src = r.stream_body ())
      o.body = co_await read_all (*src);

    o.headers = r.headers;

    // Fixed policy: non-2xx is a result, not a failure, retrying is up to
    // the caller, and the server certificate is not verified.
    //
    o.follow_redirect = s.follow_redirect;
    o.throw_http_errors = false;
    o.retry = 0;
    o.decompress = true;
    o.reject_unauthorized = false;

    if (s.timeout_ms > 0)
      o.timeout = chrono::milliseconds (s.timeout_ms);

    if (s.remember_cookies && store_ != nullptr)
      o.cookies = make_shared<cookie_jar> (store_);

    co_await auth_.apply (o.headers, o);

    // Certificates and proxy exclusions are keyed on the URL as written.
    //
    if (optional<client_certificate> c = certificates_.resolve (r.url, s))
      o.certificate = move (*c);

    proxy_.resolve (o, r.url, s);

    co_return o;
  }
}
