#include <courier/cert/cert-resolver.hxx>

#include <fstream>
#include <sstream>
#include <iostream>
#include <system_error>

#include <courier/http/http-url.hxx>
#include <courier/http/http-error.hxx>

using namespace std;

namespace courier
{
  optional<client_certificate> certificate_resolver::
  resolve (const string& url, const courier_settings& s) const
  {
    string host (parse_url (url).authority ());

    auto i (s.host_certificates.find (host));
    if (i == s.host_certificates.end ())
      return nullopt;

    if (verbose_)
      cout << "using client certificate configured for " << host << endl;

    const certificate_config& c (i->second);

    client_certificate r;
    r.cert = load (c.cert);
    r.key = load (c.key);
    r.pfx = load (c.pfx);
    r.passphrase = c.passphrase;
    return r;
  }

  optional<string> certificate_resolver::
  load (const optional<string>& path) const
  {
    if (!path)
      return nullopt;

    fs::path p (*path);

    if (p.is_absolute ())
      return read (p, *path);

    // Relative to the workspace root if there is one, otherwise to the
    // directory of the file the request came from.
    //
    if (optional<fs::path> r = workspace_.root ())
      return read (*r / p, *path);

    if (optional<fs::path> f = workspace_.current_file ())
      return read (f->parent_path () / p, *path);

    return nullopt;
  }

  optional<string> certificate_resolver::
  read (const fs::path& p, const string& configured) const
  {
    error_code ec;
    if (!fs::exists (p, ec))
    {
      cerr << "warning: certificate path " << configured
           << " doesn't exist, please make sure it exists" << endl;
      return nullopt;
    }

    ifstream ifs (p, ios::binary);
    if (!ifs)
      throw configuration_error ("unable to read certificate " + p.string ());

    ostringstream os;
    os << ifs.rdbuf ();
    return os.str ();
  }
}
