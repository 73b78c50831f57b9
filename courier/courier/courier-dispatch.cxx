#include <courier/courier-dispatch.hxx>

#include <utility>
#include <iostream>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/errc.hpp>

#include <courier/http/http-error.hxx>
#include <courier/response/response-consumer.hxx>

using namespace std;

namespace courier
{
  http_dispatcher::
  http_dispatcher (http_transport& t,
                   const workspace_context& w,
                   fs::path cf)
      : transport_ (t),
        cookie_file_ (move (cf)),
        own_cognito_ (make_unique<cognito_idp_authenticator> (t)),
        auth_ (*own_cognito_),
        certificates_ (w),
        builder_ (auth_, certificates_, proxy_)
  {
    builder_.set_cookie_store (make_shared<file_cookie_store> (cookie_file_));
  }

  http_dispatcher::
  http_dispatcher (http_transport& t,
                   const workspace_context& w,
                   fs::path cf,
                   cognito_authenticator& c)
      : transport_ (t),
        cookie_file_ (move (cf)),
        auth_ (c),
        certificates_ (w),
        builder_ (auth_, certificates_, proxy_)
  {
    builder_.set_cookie_store (make_shared<file_cookie_store> (cookie_file_));
  }

  void http_dispatcher::
  set_verbose (bool v)
  {
    verbose_ = v;
    certificates_.set_verbose (v);
    proxy_.set_verbose (v);
  }

  asio::awaitable<shared_ptr<http_response>> http_dispatcher::
  send (const http_request& r,
        const courier_settings& s,
        shared_ptr<request_handle> h)
  {
    if (h == nullptr)
      h = make_shared<request_handle> ();

    if (verbose_)
      cout << "sending " << r << endl;

    transport_options o (co_await builder_.prepare (r, s));

    if (h->cancelled ())
      throw network_error (asio::error::operation_aborted, "request cancelled");

    auto ex (co_await asio::this_coro::executor);
    auto c (make_shared<response_consumer> (ex, r, h, s.decode_escaped_unicode));

    // The transport keeps running after an event stream has been resolved,
    // so the consumer is owned by the completion handler.
    //
    asio::co_spawn (
      ex,
      transport_.perform (move (o), *c, h),
      [c, v = verbose_] (exception_ptr e)
      {
        if (e)
        {
          // After resolution an error only ends the live stream.
          //
          if (!c->fail (e) && v)
          {
            try
            {
              rethrow_exception (e);
            }
            catch (const exception& x)
            {
              cout << "stream ended: " << x.what () << endl;
            }
          }
        }
        else if (!c->settled ())
          c->fail (make_exception_ptr (
            network_error (boost::system::errc::make_error_code (
                             boost::system::errc::connection_aborted),
                           "connection closed before a response was received")));
      });

    shared_ptr<http_response> rs (co_await c->wait ());

    if (verbose_)
      cout << "received " << *rs << endl;

    co_return rs;
  }

  void http_dispatcher::
  clear_cookies ()
  {
    fs::remove (cookie_file_);
    builder_.set_cookie_store (make_shared<file_cookie_store> (cookie_file_));
  }
}
