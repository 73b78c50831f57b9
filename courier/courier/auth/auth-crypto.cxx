#include <courier/auth/auth-crypto.hxx>

#include <vector>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

using namespace std;

namespace courier
{
  static string
  digest (const EVP_MD* md, const string& d)
  {
    // Create and initialize the OpenSSL digest context.
    //
    EVP_MD_CTX* ctx (EVP_MD_CTX_new ());
    if (ctx == nullptr)
      throw runtime_error ("unable to allocate digest context");

    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    bool ok (EVP_DigestInit_ex (ctx, md, nullptr) == 1 &&
             EVP_DigestUpdate (ctx, d.data (), d.size ()) == 1 &&
             EVP_DigestFinal_ex (ctx, h, &n) == 1);

    EVP_MD_CTX_free (ctx);

    if (!ok)
      throw runtime_error ("unable to compute digest");

    return string (reinterpret_cast<const char*> (h), n);
  }

  string
  md5_hex (const string& d)
  {
    return to_hex (digest (EVP_md5 (), d));
  }

  string
  sha256_hex (const string& d)
  {
    return to_hex (digest (EVP_sha256 (), d));
  }

  string
  hmac_sha256 (const string& k, const string& d)
  {
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (HMAC (EVP_sha256 (),
              k.data (), static_cast<int> (k.size ()),
              reinterpret_cast<const unsigned char*> (d.data ()), d.size (),
              h, &n) == nullptr)
      throw runtime_error ("unable to compute HMAC");

    return string (reinterpret_cast<const char*> (h), n);
  }

  string
  to_hex (const string& b)
  {
    static const char x[] = "0123456789abcdef";

    string r;
    r.reserve (b.size () * 2);

    for (unsigned char c: b)
    {
      r += x[c >> 4];
      r += x[c & 0x0f];
    }

    return r;
  }

  string
  base64_encode (const string& d)
  {
    // EVP_EncodeBlock() writes 4 output bytes per 3 input bytes plus the
    // terminating NUL.
    //
    vector<unsigned char> o (4 * ((d.size () + 2) / 3) + 1);

    int n (EVP_EncodeBlock (o.data (),
                            reinterpret_cast<const unsigned char*> (d.data ()),
                            static_cast<int> (d.size ())));

    return string (reinterpret_cast<const char*> (o.data ()),
                   static_cast<size_t> (n));
  }

  string
  random_hex (size_t n)
  {
    string b (n, '\0');

    if (RAND_bytes (reinterpret_cast<unsigned char*> (b.data ()),
                    static_cast<int> (n)) != 1)
      throw runtime_error ("unable to generate random bytes");

    return to_hex (b);
  }
}
