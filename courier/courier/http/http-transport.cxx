#include <courier/http/http-transport.hxx>

#include <utility>

using namespace std;

namespace courier
{
  void request_handle::
  cancel ()
  {
    if (cancelled_)
      return;

    cancelled_ = true;

    if (canceller_)
      canceller_ ();
  }

  void request_handle::
  bind (canceller c)
  {
    canceller_ = move (c);

    if (cancelled_ && canceller_)
      canceller_ ();
  }

  void request_handle::
  unbind () noexcept
  {
    canceller_ = nullptr;
  }
}
