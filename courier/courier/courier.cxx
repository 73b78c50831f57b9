#include <chrono>
#include <memory>
#include <string>
#include <iostream>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <courier/courier-options.hxx>
#include <courier/version.hxx>

#include <courier/courier-settings.hxx>
#include <courier/courier-dispatch.hxx>
#include <courier/courier-workspace.hxx>

#include <courier/http/http-error.hxx>
#include <courier/http/http-client.hxx>
#include <courier/http/http-request.hxx>
#include <courier/cookie/cookie-store.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace courier
{
  // Parse a "Name: value" header argument.
  //
  static http_field
  parse_header_option (const string& a)
  {
    size_t p (a.find (':'));

    if (p == string::npos || p == 0)
      throw configuration_error ("invalid header '" + a +
                                 "': expected <name>:<value>");

    string v (a.substr (p + 1));
    v.erase (0, v.find_first_not_of (" \t"));

    return http_field (a.substr (0, p), move (v));
  }

  static void
  print_head (const http_response& r)
  {
    cout << r << '\n';

    for (const http_field& f: r.headers)
      cout << f.name << ": " << f.value << '\n';

    cout << '\n';
  }

  // Send the request and print the result.
  //
  // Event streams are printed as they grow until the stream ends.
  //
  static asio::awaitable<int>
  run (http_dispatcher& d,
       const http_request& rq,
       const courier_settings& s,
       bool include)
  {
    auto h (make_shared<request_handle> ());
    shared_ptr<http_response> r (co_await d.send (rq, s, h));

    if (include)
      print_head (*r);

    size_t n (0);
    auto flush = [&r, &n] ()
    {
      if (r->body.size () > n)
      {
        cout.write (r->body.data () + n, r->body.size () - n);
        cout.flush ();
        n = r->body.size ();
      }
    };

    if (!r->complete)
    {
      asio::steady_timer t (co_await asio::this_coro::executor);

      while (!r->complete)
      {
        flush ();

        t.expires_after (chrono::milliseconds (50));
        co_await t.async_wait (asio::use_awaitable);
      }
    }

    flush ();

    if (!r->body.empty () && r->body.back () != '\n')
      cout << endl;

    co_return 0;
  }
}

int
main (int argc, char* argv[])
{
  using namespace courier;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "courier " << COURIER_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: courier [options] --url <url>" << "\n"
        << "options:"                             << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!opt.url_specified () && !opt.clear_cookies ())
    {
      cerr << "error: request URL expected" << "\n"
           << "  info: run 'courier --help' for more information" << endl;
      return 1;
    }

    courier_settings s (opt.settings_specified ()
                        ? load_settings (opt.settings ())
                        : courier_settings ());

    static_workspace w (
      opt.workspace_specified ()
      ? optional<fs::path> (fs::absolute (opt.workspace ()))
      : nullopt,
      opt.http_file_specified ()
      ? optional<fs::path> (fs::absolute (opt.http_file ()))
      : nullopt);

    fs::path cf (opt.cookie_file_specified ()
                 ? fs::path (opt.cookie_file ())
                 : default_cookie_file ());

    asio::io_context ioc;

    http_client client (ioc);
    client.user_agent = string ("courier/") + COURIER_VERSION_ID;
    client.set_verbose (opt.verbose ());

    http_dispatcher d (client, w, cf);
    d.set_verbose (opt.verbose ());

    if (opt.clear_cookies ())
    {
      d.clear_cookies ();

      if (opt.verbose ())
        cout << "removed cookies in " << cf.string () << endl;

      if (!opt.url_specified ())
        return 0;
    }

    // Assemble the request.
    //
    http_request rq (to_http_method (opt.request ()), opt.url ());
    rq.name = opt.name ();

    for (const string& a: opt.header ())
    {
      http_field f (parse_header_option (a));
      rq.headers.add (move (f.name), move (f.value));
    }

    if (opt.data_specified () && opt.data_file_specified ())
      throw configuration_error ("both --data and --data-file specified");

    if (opt.data_specified ())
    {
      rq.body = http_request::body_type (opt.data ());
      rq.raw_body = opt.data ();
    }
    else if (opt.data_file_specified ())
    {
      rq.body = http_request::body_type (
        static_pointer_cast<byte_source> (
          make_shared<file_source> (fs::path (opt.data_file ()))));
      rq.raw_body = "< " + opt.data_file ();
    }

    int exit_code (0);

    asio::co_spawn (
      ioc,
      run (d, rq, s, opt.include ()),
      [&exit_code, &ioc] (exception_ptr ex, int r)
      {
        exit_code = r;
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
