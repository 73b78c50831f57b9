#include <courier/auth/auth-dispatcher.hxx>

#include <string>
#include <vector>
#include <sstream>
#include <utility>

#include <courier/auth/auth-aws.hxx>
#include <courier/auth/auth-digest.hxx>

using namespace std;

namespace courier
{
  asio::awaitable<void> auth_dispatcher::
  apply (http_headers& h, transport_options& o) const
  {
    optional<string> a (h.get ("Authorization"));

    if (!a)
      co_return;

    vector<string> ts;
    {
      istringstream is (*a);
      for (string t; is >> t; )
        ts.push_back (move (t));
    }

    if (ts.size () < 2)
      co_return;

    string scheme (to_lower (ts[0]));
    const string& user (ts[1]);

    if (ts.size () > 2)
    {
      string pass;
      for (size_t i (2); i != ts.size (); ++i)
      {
        if (i != 2)
          pass += ' ';

        pass += ts[i];
      }

      if (scheme == "basic")
      {
        h.remove ("Authorization");
        o.username = user;
        o.password = move (pass);
      }
      else if (scheme == "digest")
      {
        h.remove ("Authorization");
        o.after_response.push_back (digest_hook (user, move (pass)));
      }
      else if (scheme == "aws")
      {
        h.remove ("Authorization");
        o.before_request.push_back (aws_signature_hook (*a));
      }
      else if (scheme == "cognito")
      {
        h.remove ("Authorization");
        o.before_request.push_back (co_await cognito_hook (*a, cognito_));
      }
    }
    else if (scheme == "basic")
    {
      size_t p (user.find (':'));

      if (p != string::npos)
      {
        h.remove ("Authorization");
        o.username = user.substr (0, p);
        o.password = user.substr (p + 1);
      }
    }
  }
}
