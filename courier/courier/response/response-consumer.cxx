#include <courier/response/response-consumer.hxx>

#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <courier/http/http-mime.hxx>

using namespace std;

namespace courier
{
  response_consumer::
  response_consumer (asio::any_io_executor ex,
                     http_request logical,
                     shared_ptr<request_handle> h,
                     bool decode)
      : logical_ (move (logical)),
        handle_ (move (h)),
        decode_unicode_ (decode),
        signal_ (ex, asio::steady_timer::time_point::max ())
  {
  }

  // Lower-case the names and merge repeated fields into one comma-separated
  // value (except Set-Cookie which cannot be merged).
  //
  static http_headers
  merge_headers (const http_headers& raw)
  {
    http_headers r;
    unordered_map<string, size_t> idx;

    for (const http_field& f: raw)
    {
      string n (to_lower (f.name));

      auto i (idx.find (n));
      if (i != idx.end () && n != "set-cookie")
      {
        r.fields[i->second].value += ", " + f.value;
        continue;
      }

      idx.emplace (n, r.fields.size ());
      r.add (move (n), f.value);
    }

    return r;
  }

  void response_consumer::
  on_response (const response_metadata& m, const transport_request& sent)
  {
    // Approximate header bytes: the raw names and values plus one byte per
    // header line.
    //
    uint64_t hs (0);
    for (const http_field& f: m.headers)
      hs += f.name.size () + f.value.size ();
    hs += m.headers.size ();

    optional<string> ct (m.headers.get ("Content-Type"));
    optional<media_type> mt (ct ? optional<media_type> (parse_media_type (*ct))
                                : nullopt);

    decoder_.emplace (mt ? mt->charset () : nullopt);

    if (decode_unicode_)
      unescaper_.emplace ();

    auto r (make_shared<http_response> ());
    r->status = m.status;
    r->reason = m.reason;
    r->version = m.version;
    r->headers = normalize_header_names (merge_headers (m.headers),
                                         m.headers.names ());
    r->headers_size = hs;
    r->timings = m.timings;
    r->raw = handle_;

    // Echo of what actually went out, with header names re-cased after the
    // caller's request.
    //
    http_headers sh;
    for (const http_field& f: sent.headers)
      sh.add (to_lower (f.name), f.value);

    http_request& q (r->request);
    q.method = sent.method;
    q.url = sent.url;
    q.headers = normalize_header_names (sh, logical_.headers.names ());

    if (sent.body)
      q.body = http_request::body_type (
        static_pointer_cast<byte_source> (make_shared<memory_source> (*sent.body)));

    q.raw_body = logical_.raw_body;
    q.name = logical_.name;

    response_ = move (r);

    if (mt && mt->essence () == "text/event-stream")
      resolve ();
  }

  void response_consumer::
  on_data (const char* d, size_t n)
  {
    http_response& r (*response_);

    r.body_buffer.append (d, n);

    string t (decoder_->decode (d, n));
    if (unescaper_)
      t = unescaper_->feed (t);

    r.body += t;
    r.body_size += n;
  }

  void response_consumer::
  on_end (const timing_phases& t)
  {
    http_response& r (*response_);

    string s (decoder_->flush ());
    if (unescaper_)
      s = unescaper_->feed (s) + unescaper_->flush ();

    r.body += s;
    r.timings = t;
    r.complete = true;

    resolve ();
  }

  bool response_consumer::
  fail (exception_ptr e)
  {
    if (state_ != state::pending)
    {
      if (response_ != nullptr)
        response_->complete = true;

      return false;
    }

    state_ = state::rejected;
    error_ = move (e);
    signal_.cancel ();
    return true;
  }

  void response_consumer::
  resolve ()
  {
    if (state_ != state::pending)
      return;

    state_ = state::resolved;
    signal_.cancel ();
  }

  asio::awaitable<shared_ptr<http_response>> response_consumer::
  wait ()
  {
    // The timer never expires on its own: settling cancels it.
    //
    if (state_ == state::pending)
    {
      boost::system::error_code ec;
      co_await signal_.async_wait (asio::redirect_error (asio::use_awaitable, ec));
    }

    if (error_)
      rethrow_exception (error_);

    co_return response_;
  }
}
