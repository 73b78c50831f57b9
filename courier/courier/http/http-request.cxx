#include <courier/http/http-request.hxx>

#include <stdexcept>

using namespace std;

namespace courier
{
  file_source::
  file_source (fs::path p, size_t c)
      : path_ (move (p)), chunk_ (c)
  {
  }

  asio::awaitable<optional<string>> file_source::
  read ()
  {
    // Open lazily so that constructing a request never touches the
    // filesystem.
    //
    if (!ifs_.is_open ())
    {
      ifs_.open (path_, ios::binary);

      if (!ifs_)
        throw runtime_error ("unable to open request body file " +
                             path_.string ());
    }

    string b (chunk_, '\0');
    ifs_.read (b.data (), static_cast<streamsize> (b.size ()));

    streamsize n (ifs_.gcount ());

    if (n <= 0)
    {
      if (ifs_.bad ())
        throw runtime_error ("unable to read request body file " +
                             path_.string ());

      co_return nullopt;
    }

    b.resize (static_cast<size_t> (n));
    co_return b;
  }

  asio::awaitable<optional<string>> memory_source::
  read ()
  {
    if (done_)
      co_return nullopt;

    done_ = true;
    co_return data_;
  }

  asio::awaitable<string>
  read_all (byte_source& s)
  {
    string r;

    while (optional<string> c = co_await s.read ())
      r += *c;

    co_return r;
  }
}
