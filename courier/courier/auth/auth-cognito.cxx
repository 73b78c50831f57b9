#include <courier/auth/auth-cognito.hxx>

#include <vector>
#include <memory>
#include <sstream>
#include <utility>

#include <boost/json.hpp>

#include <courier/http/http-error.hxx>

using namespace std;

namespace courier
{
  namespace json = boost::json;

  cognito_parameters
  parse_cognito_authorization (const string& line)
  {
    istringstream is (line);
    vector<string> ts;
    for (string t; is >> t; )
      ts.push_back (move (t));

    if (ts.size () != 6 || !iequals (ts[0], "cognito"))
      throw auth_resolution_error (
        "invalid Cognito authorization: expected "
        "'Cognito <username> <password> <region> <userPoolId> <clientId>'");

    cognito_parameters r;
    r.username     = ts[1];
    r.password     = ts[2];
    r.region       = ts[3];
    r.user_pool_id = ts[4];
    r.client_id    = ts[5];
    return r;
  }

  namespace
  {
    // Collect the whole response in memory.
    //
    class collect_sink: public response_sink
    {
    public:
      void
      on_response (const response_metadata& m, const transport_request&) override
      {
        status = m.status;
      }

      void
      on_data (const char* d, size_t n) override
      {
        body.append (d, n);
      }

      void
      on_end (const timing_phases&) override
      {
      }

      uint16_t status = 0;
      string body;
    };
  }

  asio::awaitable<string> cognito_idp_authenticator::
  authenticate (const cognito_parameters& p)
  {
    json::object ap;
    ap["USERNAME"] = p.username;
    ap["PASSWORD"] = p.password;

    json::object rq;
    rq["AuthFlow"] = "USER_PASSWORD_AUTH";
    rq["ClientId"] = p.client_id;
    rq["AuthParameters"] = move (ap);

    transport_options o;
    o.method = http_method::post;
    o.url = "https://cognito-idp." + p.region + ".amazonaws.com/";
    o.headers.set ("Content-Type", "application/x-amz-json-1.1");
    o.headers.set ("X-Amz-Target",
                   "AWSCognitoIdentityProviderService.InitiateAuth");
    o.body = json::serialize (rq);
    o.follow_redirect = false;
    o.reject_unauthorized = true;

    collect_sink s;

    try
    {
      co_await transport_.perform (move (o),
                                   s,
                                   make_shared<request_handle> ());
    }
    catch (const network_error& e)
    {
      throw auth_resolution_error (
        string ("unable to reach Cognito user pool ") + p.user_pool_id +
        ": " + e.what ());
    }

    json::value v;
    try
    {
      v = json::parse (s.body);
    }
    catch (const exception& e)
    {
      throw auth_resolution_error (
        string ("invalid Cognito response: ") + e.what ());
    }

    const json::object* obj (v.if_object ());

    if (s.status != 200 || obj == nullptr)
    {
      string m ("Cognito sign-in failed with status " +
                std::to_string (s.status));

      if (obj != nullptr)
      {
        if (const json::value* t = obj->if_contains ("__type"))
          if (t->is_string ())
            m += ": " + json::value_to<string> (*t);

        if (const json::value* d = obj->if_contains ("message"))
          if (d->is_string ())
            m += " (" + json::value_to<string> (*d) + ")";
      }

      throw auth_resolution_error (m);
    }

    // A challenge (new password required, MFA) cannot be answered from an
    // authorization line.
    //
    if (const json::value* c = obj->if_contains ("ChallengeName"))
    {
      throw auth_resolution_error (
        "Cognito sign-in requires answering challenge " +
        (c->is_string () ? json::value_to<string> (*c) : string ("unknown")));
    }

    const json::value* ar (obj->if_contains ("AuthenticationResult"));
    const json::value* at (ar != nullptr && ar->is_object ()
                           ? ar->as_object ().if_contains ("AccessToken")
                           : nullptr);

    if (at == nullptr || !at->is_string ())
      throw auth_resolution_error ("Cognito response carries no access token");

    co_return json::value_to<string> (*at);
  }

  asio::awaitable<before_request_hook>
  cognito_hook (const string& authorization, cognito_authenticator& a)
  {
    cognito_parameters p (parse_cognito_authorization (authorization));
    string token (co_await a.authenticate (p));

    co_return [token = move (token)] (transport_request& r)
    {
      r.headers.set ("Authorization", token);
    };
  }
}
