#include <courier/http/http-client.hxx>

#include <chrono>
#include <limits>
#include <utility>
#include <iostream>
#include <functional>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/system/errc.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>
#include <openssl/pkcs12.h>

#include <courier/http/http-url.hxx>
#include <courier/http/http-error.hxx>
#include <courier/http/http-content.hxx>

#include <courier/auth/auth-crypto.hxx>
#include <courier/cookie/cookie-jar.hxx>

using namespace std;

namespace courier
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace ssl = asio::ssl;
  using tcp = asio::ip::tcp;

  namespace
  {
    using clock_type = chrono::steady_clock;
    using parser_type = http::response_parser<http::buffer_body>;

    // Decide what to do with a response head: return true to deliver it to
    // the sink or false to drop the connection (redirect, reissue).
    //
    using decide_function =
      function<bool (const response_metadata&, transport_request&)>;

    // Per-hop state threaded through the connection helpers.
    //
    struct hop_state
    {
      const transport_options&         options;
      shared_ptr<request_handle>       handle;
      clock_type::time_point           start;     // Of the whole request.
      optional<clock_type::time_point> deadline;
      timing_phases                    timings;
      clock_type::time_point           mark;      // End of the last phase.
    };

    timing_phases::duration
    elapsed (clock_type::time_point from, clock_type::time_point to)
    {
      return chrono::duration_cast<timing_phases::duration> (to - from);
    }

    // Close the current phase and return its duration.
    //
    timing_phases::duration
    lap (hop_state& st)
    {
      clock_type::time_point now (clock_type::now ());
      auto r (elapsed (st.mark, now));
      st.mark = now;
      return r;
    }

    void
    check_cancelled (const hop_state& st)
    {
      if (st.handle->cancelled ())
        throw network_error (asio::error::operation_aborted,
                             "request cancelled");
    }

    template <typename L>
    void
    arm (L& layer, const hop_state& st)
    {
      if (st.deadline)
        layer.expires_at (*st.deadline);
      else
        layer.expires_never ();
    }

    // Bind the request handle to a connection for the duration of a hop.
    //
    class cancel_binding
    {
    public:
      cancel_binding (shared_ptr<request_handle> h, beast::tcp_stream& s)
          : handle_ (move (h))
      {
        handle_->bind ([&s] {s.cancel ();});
      }

      ~cancel_binding ()
      {
        handle_->unbind ();
      }

      cancel_binding (const cancel_binding&) = delete;
      cancel_binding& operator= (const cancel_binding&) = delete;

    private:
      shared_ptr<request_handle> handle_;
    };

    http::verb
    to_beast_verb (http_method m)
    {
      switch (m)
      {
      case http_method::get:     return http::verb::get;
      case http_method::head:    return http::verb::head;
      case http_method::post:    return http::verb::post;
      case http_method::put:     return http::verb::put;
      case http_method::delete_: return http::verb::delete_;
      case http_method::connect: return http::verb::connect;
      case http_method::options: return http::verb::options;
      case http_method::trace:   return http::verb::trace;
      case http_method::patch:   return http::verb::patch;
      }

      return http::verb::get;
    }

    // Load PKCS#12 bundle into the context.
    //
    void
    use_pkcs12 (ssl::context& ctx,
                const string& pfx,
                const optional<string>& pass)
    {
      unique_ptr<BIO, decltype (&BIO_free)> bio (
        BIO_new_mem_buf (pfx.data (), static_cast<int> (pfx.size ())),
        &BIO_free);

      unique_ptr<PKCS12, decltype (&PKCS12_free)> p12 (
        bio != nullptr ? d2i_PKCS12_bio (bio.get (), nullptr) : nullptr,
        &PKCS12_free);

      if (p12 == nullptr)
        throw configuration_error ("invalid PKCS#12 client certificate");

      EVP_PKEY* k (nullptr);
      X509* c (nullptr);
      STACK_OF (X509)* ca (nullptr);

      if (PKCS12_parse (p12.get (),
                        pass ? pass->c_str () : nullptr,
                        &k, &c, &ca) != 1)
        throw configuration_error (
          "unable to decrypt PKCS#12 client certificate (wrong passphrase?)");

      unique_ptr<EVP_PKEY, decltype (&EVP_PKEY_free)> key (k, &EVP_PKEY_free);
      unique_ptr<X509, decltype (&X509_free)> cert (c, &X509_free);

      bool ok (cert != nullptr && key != nullptr &&
               SSL_CTX_use_certificate (ctx.native_handle (), cert.get ()) == 1 &&
               SSL_CTX_use_PrivateKey (ctx.native_handle (), key.get ()) == 1);

      // The context takes ownership of the chain certificates.
      //
      if (ca != nullptr)
      {
        while (X509* x = sk_X509_shift (ca))
        {
          if (SSL_CTX_add_extra_chain_cert (ctx.native_handle (), x) != 1)
          {
            X509_free (x);
            ok = false;
          }
        }

        sk_X509_free (ca);
      }

      if (!ok)
        throw configuration_error ("unable to use PKCS#12 client certificate");
    }

    // Create the TLS context for one connection.
    //
    ssl::context
    make_context (const optional<client_certificate>& cc, bool verify)
    {
      ssl::context ctx (ssl::context::tls_client);

      if (verify)
        ctx.set_default_verify_paths ();

      if (!cc || cc->empty ())
        return ctx;

      try
      {
        if (cc->passphrase)
        {
          string p (*cc->passphrase);
          ctx.set_password_callback (
            [p] (size_t, ssl::context::password_purpose) {return p;});
        }

        if (cc->pfx)
          use_pkcs12 (ctx, *cc->pfx, cc->passphrase);

        if (cc->cert)
          ctx.use_certificate_chain (asio::buffer (*cc->cert));

        if (cc->key)
          ctx.use_private_key (asio::buffer (*cc->key), ssl::context::pem);
      }
      catch (const boost::system::system_error& e)
      {
        throw configuration_error (
          string ("unable to use client certificate: ") + e.what ());
      }

      return ctx;
    }

    asio::awaitable<void>
    connect (beast::tcp_stream& s,
             const string& host,
             const string& port,
             hop_state& st)
    {
      st.timings.wait = elapsed (st.start, clock_type::now ());
      st.mark = clock_type::now ();

      tcp::resolver r (s.get_executor ());
      auto addrs (co_await r.async_resolve (host, port, asio::use_awaitable));
      st.timings.dns = lap (st);

      check_cancelled (st);

      arm (s, st);
      co_await s.async_connect (addrs, asio::use_awaitable);
      st.timings.tcp = lap (st);
    }

    template <typename S>
    asio::awaitable<void>
    handshake (S& s, const string& host, bool verify, hop_state& st)
    {
      // Beast doesn't wrap SNI so go to the OpenSSL handle directly.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw network_error (ec, "unable to set SNI hostname");
      }

      if (verify)
      {
        s.set_verify_mode (ssl::verify_peer);
        s.set_verify_callback (ssl::host_name_verification (host));
      }
      else
        s.set_verify_mode (ssl::verify_none);

      check_cancelled (st);

      arm (beast::get_lowest_layer (s), st);
      co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);

      // With a proxy over TLS both handshakes count.
      //
      auto d (lap (st));
      st.timings.tls = st.timings.tls ? *st.timings.tls + d : d;
    }

    // Ask the proxy to open a tunnel to the target.
    //
    template <typename S>
    asio::awaitable<void>
    tunnel (S& s, const url_parts& u, hop_state& st)
    {
      string a (u.host.find (':') != string::npos ? '[' + u.host + ']' : u.host);
      a += ':' + std::to_string (u.effective_port ());

      http::request<http::empty_body> rq (http::verb::connect, a, 11);
      rq.set (http::field::host, a);

      check_cancelled (st);

      arm (beast::get_lowest_layer (s), st);
      co_await http::async_write (s, rq, asio::use_awaitable);

      beast::flat_buffer b;
      http::response_parser<http::empty_body> p;
      p.skip (true);

      co_await http::async_read_header (s, b, p, asio::use_awaitable);

      unsigned int c (p.get ().result_int ());
      if (c < 200 || c >= 300)
        throw network_error (
          boost::system::errc::make_error_code (
            boost::system::errc::connection_refused),
          "proxy refused tunnel to " + a + " with status " +
          std::to_string (c));
    }

    // Send the request over an established connection and read the response.
    //
    // Return false if the response was not delivered.
    //
    template <typename S>
    asio::awaitable<bool>
    exchange (S& s,
              transport_request& w,
              const string& target,
              const string& user_agent,
              hop_state& st,
              response_sink& sink,
              const decide_function& decide)
    {
      auto& layer (beast::get_lowest_layer (s));
      url_parts u (parse_url (w.url));

      http::request<http::string_body> br;
      br.method (to_beast_verb (w.method));
      br.target (target);
      br.version (11);

      for (const http_field& f: w.headers)
        br.insert (f.name, f.value);

      if (!w.headers.contains ("Host"))
        br.set (http::field::host, u.authority ());

      if (!w.headers.contains ("User-Agent"))
        br.set (http::field::user_agent, user_agent);

      if (w.body)
      {
        br.body () = *w.body;
        br.prepare_payload ();
      }

      check_cancelled (st);

      arm (layer, st);
      co_await http::async_write (s, br, asio::use_awaitable);
      st.timings.request = lap (st);

      beast::flat_buffer b;
      parser_type p;
      p.body_limit (numeric_limits<uint64_t>::max ());

      if (w.method == http_method::head)
        p.skip (true);

      co_await http::async_read_header (s, b, p, asio::use_awaitable);
      st.timings.first_byte = lap (st);

      auto& h (p.get ());

      response_metadata m;
      m.status = static_cast<uint16_t> (h.result_int ());
      m.reason = string (h.reason ());
      m.version = http_version (static_cast<uint8_t> (h.version () / 10),
                                static_cast<uint8_t> (h.version () % 10));

      for (const auto& f: h)
        m.headers.add (string (f.name_string ()), string (f.value ()));

      m.timings = st.timings;

      if (!decide (m, w))
        co_return false;

      content_decoder dec (st.options.decompress
                           ? to_content_coding (m.headers.get ("Content-Encoding"))
                           : content_coding::identity);

      sink.on_response (m, w);

      char buf[8192];

      while (!p.is_done ())
      {
        check_cancelled (st);

        h.body ().data = buf;
        h.body ().size = sizeof (buf);

        // Reset the timer for each chunk, the deadline itself does not move.
        //
        arm (layer, st);

        beast::error_code ec;
        co_await http::async_read_some (
          s, b, p, asio::redirect_error (asio::use_awaitable, ec));

        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw network_error (ec, "unable to read response body");

        size_t n (sizeof (buf) - h.body ().size);

        if (n != 0)
        {
          string d (dec.decode (buf, n));

          if (!d.empty ())
            sink.on_data (d.data (), d.size ());
        }
      }

      dec.finish ();

      st.timings.download = lap (st);
      st.timings.total = elapsed (st.start, clock_type::now ());

      // Many servers just drop the connection instead of a proper TLS
      // shutdown, so only close the socket.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);

      sink.on_end (st.timings);
      co_return true;
    }

    // Connect (directly or through the proxy) and run the exchange.
    //
    asio::awaitable<bool>
    hop (asio::io_context& ioc,
         transport_request& w,
         const string& user_agent,
         hop_state& st,
         response_sink& sink,
         const decide_function& decide)
    {
      const transport_options& o (st.options);
      url_parts u (parse_url (w.url));
      string port (std::to_string (u.effective_port ()));

      // The agent was picked for the original target but a redirect may
      // switch schemes, so tunnel or forward based on this hop's URL.
      //
      if (!o.agent)
      {
        if (u.secure ())
        {
          ssl::context ctx (make_context (o.certificate, o.reject_unauthorized));
          beast::ssl_stream<beast::tcp_stream> s (ioc, ctx);
          cancel_binding cb (st.handle, beast::get_lowest_layer (s));

          co_await connect (beast::get_lowest_layer (s), u.host, port, st);
          co_await handshake (s, u.host, o.reject_unauthorized, st);
          co_return co_await exchange (s, w, u.target, user_agent, st, sink, decide);
        }
        else
        {
          beast::tcp_stream s (ioc);
          cancel_binding cb (st.handle, s);

          co_await connect (s, u.host, port, st);
          co_return co_await exchange (s, w, u.target, user_agent, st, sink, decide);
        }
      }

      const proxy_agent& a (*o.agent);
      string pp (std::to_string (a.port));

      if (a.scheme == "https")
      {
        ssl::context pctx (make_context (nullopt, a.strict_ssl));
        beast::ssl_stream<beast::tcp_stream> ps (ioc, pctx);
        cancel_binding cb (st.handle, beast::get_lowest_layer (ps));

        co_await connect (beast::get_lowest_layer (ps), a.host, pp, st);
        co_await handshake (ps, a.host, a.strict_ssl, st);

        if (!u.secure ())
          co_return co_await exchange (ps, w, w.url, user_agent, st, sink, decide);

        co_await tunnel (ps, u, st);

        ssl::context ctx (make_context (o.certificate, o.reject_unauthorized));
        ssl::stream<beast::ssl_stream<beast::tcp_stream>&> s (ps, ctx);

        co_await handshake (s, u.host, o.reject_unauthorized, st);
        co_return co_await exchange (s, w, u.target, user_agent, st, sink, decide);
      }
      else
      {
        if (!u.secure ())
        {
          beast::tcp_stream s (ioc);
          cancel_binding cb (st.handle, s);

          co_await connect (s, a.host, pp, st);
          co_return co_await exchange (s, w, w.url, user_agent, st, sink, decide);
        }

        ssl::context ctx (make_context (o.certificate, o.reject_unauthorized));
        beast::ssl_stream<beast::tcp_stream> s (ioc, ctx);
        cancel_binding cb (st.handle, beast::get_lowest_layer (s));

        co_await connect (beast::get_lowest_layer (s), a.host, pp, st);
        co_await tunnel (beast::get_lowest_layer (s), u, st);
        co_await handshake (s, u.host, o.reject_unauthorized, st);
        co_return co_await exchange (s, w, u.target, user_agent, st, sink, decide);
      }
    }

    bool
    redirect_status (uint16_t s) noexcept
    {
      return s == 301 || s == 302 || s == 303 || s == 307 || s == 308;
    }
  }

  asio::awaitable<void> http_client::
  perform (transport_options o,
           response_sink& sink,
           shared_ptr<request_handle> h)
  {
    // Everything that fails below the HTTP level is a network error.
    //
    try
    {
      co_await perform_impl (move (o), sink, move (h));
    }
    catch (const network_error&)
    {
      throw;
    }
    catch (const boost::system::system_error& e)
    {
      if (e.code () == beast::error::timeout)
        throw network_error (e.code (), "request timed out");

      throw network_error (e.code (), e.what ());
    }
  }

  asio::awaitable<void> http_client::
  perform_impl (transport_options o,
                response_sink& sink,
                shared_ptr<request_handle> h)
  {
    if (h == nullptr)
      h = make_shared<request_handle> ();

    clock_type::time_point start (clock_type::now ());

    hop_state st {o, h, start, nullopt, {}, start};

    if (o.timeout)
      st.deadline = start + *o.timeout;

    transport_request rq;
    rq.method = o.method;
    rq.url = o.url;
    rq.headers = o.headers;
    rq.body = o.body;

    if (o.username)
      rq.headers.set ("Authorization",
                      "Basic " + base64_encode (*o.username + ':' +
                                                o.password.value_or ("")));

    // Jar cookies are recomputed for each hop and appended to whatever the
    // caller set.
    //
    optional<string> user_cookie (rq.headers.get ("Cookie"));

    // Request to issue next, set by the decision below.
    //
    optional<transport_request> next;
    bool reissued (false);
    uint8_t redirects (0);

    decide_function decide (
      [&] (const response_metadata& m, transport_request& w) -> bool
      {
        if (o.cookies)
        {
          for (const http_field& f: m.headers)
            if (iequals (f.name, "Set-Cookie"))
              o.cookies->set_cookie (f.value, w.url);
        }

        // At most one hook-driven reissue per request.
        //
        if (!reissued)
        {
          for (const after_response_hook& ah: o.after_response)
          {
            if (ah (m, w))
            {
              if (verbose_)
                cout << "reissuing " << w.method << ' ' << w.url
                     << " after " << m.status << endl;

              reissued = true;
              next = w;
              return false;
            }
          }
        }

        if (!o.follow_redirect || !redirect_status (m.status))
          return true;

        optional<string> loc (m.headers.get ("Location"));
        if (!loc || loc->empty ())
          return true;

        if (redirects >= o.max_redirects)
          throw network_error (
            boost::system::errc::make_error_code (
              boost::system::errc::too_many_links),
            "maximum redirects exceeded");

        ++redirects;

        transport_request r (w);
        r.url = resolve_url (w.url, *loc);

        // 303 always switches to GET (except HEAD) and 301/302 do so after
        // POST, dropping the body along the way.
        //
        if ((m.status == 303 && w.method != http_method::head) ||
            ((m.status == 301 || m.status == 302) &&
             w.method == http_method::post))
        {
          r.method = http_method::get;
          r.body = nullopt;
          r.headers.remove ("Content-Type");
          r.headers.remove ("Content-Length");
        }

        // The copied Host would still point to the old location. Credentials
        // are not passed on to another host.
        //
        r.headers.remove ("Host");

        if (parse_url (r.url).authority () != parse_url (w.url).authority ())
          r.headers.remove ("Authorization");

        if (verbose_)
          cout << "redirect " << m.status << " to " << r.url << endl;

        next = move (r);
        return false;
      });

    for (;;)
    {
      check_cancelled (st);

      transport_request w (rq);

      if (o.cookies)
      {
        if (optional<string> c = o.cookies->cookie_header (w.url))
          w.headers.set ("Cookie",
                         user_cookie && !user_cookie->empty ()
                         ? *user_cookie + "; " + *c
                         : *c);
        else if (user_cookie)
          w.headers.set ("Cookie", *user_cookie);
        else
          w.headers.remove ("Cookie");
      }

      for (const before_request_hook& bh: o.before_request)
        bh (w);

      st.timings = timing_phases ();
      next = nullopt;

      if (co_await hop (ioc_, w, user_agent, st, sink, decide))
        break;

      // Not delivered without a follow-up request can only mean a bug in the
      // decision above.
      //
      if (!next)
        throw network_error (
          boost::system::errc::make_error_code (
            boost::system::errc::protocol_error),
          "response dropped without a follow-up request");

      rq = move (*next);
    }
  }
}
