#include <courier/cookie/cookie-store.hxx>

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <utility>
#include <iostream>
#include <algorithm>
#include <system_error>

#include <boost/json.hpp>

#include <courier/http/http-url.hxx>

using namespace std;

namespace courier
{
  namespace json = boost::json;

  bool
  domain_match (const string& host, const string& domain)
  {
    if (host == domain)
      return true;

    return host.size () > domain.size () &&
      host.compare (host.size () - domain.size (), domain.size (), domain) == 0 &&
      host[host.size () - domain.size () - 1] == '.';
  }

  bool
  path_match (const string& rp, const string& cp)
  {
    if (rp == cp)
      return true;

    if (rp.compare (0, cp.size (), cp) != 0)
      return false;

    return cp.back () == '/' || rp[cp.size ()] == '/';
  }

  string
  default_cookie_path (const string& rp)
  {
    if (rp.empty () || rp[0] != '/')
      return "/";

    size_t p (rp.rfind ('/'));
    return p == 0 ? "/" : rp.substr (0, p);
  }

  fs::path
  default_cookie_file ()
  {
    if (const char* x = getenv ("XDG_DATA_HOME"))
      if (*x != '\0')
        return fs::path (x) / "courier" / "cookie.json";

    if (const char* h = getenv ("HOME"))
      if (*h != '\0')
        return fs::path (h) / ".local" / "share" / "courier" / "cookie.json";

    return fs::path (".courier") / "cookie.json";
  }

  // memory_cookie_store
  //
  vector<cookie> memory_cookie_store::
  get (const string& url)
  {
    url_parts u (parse_url (url));
    string p (u.path ());
    auto now (chrono::system_clock::now ());

    cookies_.erase (remove_if (cookies_.begin (), cookies_.end (),
                               [now] (const cookie& c)
                               {
                                 return c.expired (now);
                               }),
                    cookies_.end ());

    vector<cookie> r;
    for (const cookie& c: cookies_)
    {
      bool dm (c.host_only ? u.host == c.domain : domain_match (u.host, c.domain));

      if (dm && path_match (p, c.path) && (!c.secure || u.secure ()))
        r.push_back (c);
    }

    stable_sort (r.begin (), r.end (),
                 [] (const cookie& x, const cookie& y)
                 {
                   return x.path.size () > y.path.size ();
                 });

    return r;
  }

  void memory_cookie_store::
  set (const string&, cookie c)
  {
    auto i (find_if (cookies_.begin (), cookies_.end (),
                     [&c] (const cookie& x)
                     {
                       return x.name == c.name &&
                              x.domain == c.domain &&
                              x.path == c.path;
                     }));

    bool e (c.expired (chrono::system_clock::now ()));

    if (i != cookies_.end ())
    {
      if (e)
        cookies_.erase (i);
      else
        *i = move (c);
    }
    else if (!e)
      cookies_.push_back (move (c));
  }

  void memory_cookie_store::
  clear ()
  {
    cookies_.clear ();
  }

  // file_cookie_store
  //
  file_cookie_store::
  file_cookie_store (fs::path p)
      : path_ (move (p))
  {
    load ();
  }

  void file_cookie_store::
  set (const string& url, cookie c)
  {
    memory_cookie_store::set (url, move (c));
    save ();
  }

  void file_cookie_store::
  clear ()
  {
    memory_cookie_store::clear ();
    save ();
  }

  void file_cookie_store::
  load ()
  {
    error_code ec;
    if (!fs::exists (path_, ec))
      return;

    ifstream ifs (path_, ios::binary);
    if (!ifs)
    {
      cerr << "warning: unable to read cookie file " << path_.string ()
           << endl;
      return;
    }

    ostringstream os;
    os << ifs.rdbuf ();

    boost::system::error_code jec;
    json::value v (json::parse (os.str (), jec));

    if (jec || !v.is_array ())
    {
      cerr << "warning: ignoring corrupt cookie file " << path_.string ()
           << endl;
      return;
    }

    for (const json::value& e: v.get_array ())
    {
      const json::object* o (e.if_object ());
      if (o == nullptr)
        continue;

      auto str = [o] (const char* k) -> string
      {
        const json::value* v (o->if_contains (k));
        return v != nullptr && v->is_string () ? string (v->get_string ())
                                               : string ();
      };

      auto flag = [o] (const char* k, bool d) -> bool
      {
        const json::value* v (o->if_contains (k));
        return v != nullptr && v->is_bool () ? v->get_bool () : d;
      };

      cookie c;
      c.name = str ("name");
      c.value = str ("value");
      c.domain = str ("domain");
      c.path = str ("path");
      c.host_only = flag ("hostOnly", true);
      c.secure = flag ("secure", false);
      c.http_only = flag ("httpOnly", false);

      if (const json::value* x = o->if_contains ("expires"))
      {
        if (x->is_int64 ())
          c.expires = cookie::time_point (chrono::seconds (x->get_int64 ()));
      }

      if (c.name.empty () || c.domain.empty () || c.path.empty ())
        continue;

      cookies_.push_back (move (c));
    }
  }

  void file_cookie_store::
  save () const
  {
    json::array a;
    for (const cookie& c: cookies_)
    {
      json::object o;
      o["name"] = c.name;
      o["value"] = c.value;
      o["domain"] = c.domain;
      o["path"] = c.path;
      o["hostOnly"] = c.host_only;
      o["secure"] = c.secure;
      o["httpOnly"] = c.http_only;

      if (c.expires)
        o["expires"] = static_cast<int64_t> (
          chrono::duration_cast<chrono::seconds> (
            c.expires->time_since_epoch ()).count ());

      a.push_back (move (o));
    }

    error_code ec;
    if (path_.has_parent_path ())
      fs::create_directories (path_.parent_path (), ec);

    ofstream ofs (path_, ios::binary | ios::trunc);
    if (!ofs)
    {
      cerr << "warning: unable to write cookie file " << path_.string ()
           << endl;
      return;
    }

    ofs << json::serialize (a);
  }
}
