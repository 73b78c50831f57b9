#include <courier/http/http-error.hxx>

#include <boost/asio/error.hpp>

namespace courier
{
  bool network_error::
  cancelled () const noexcept
  {
    return code () == boost::asio::error::operation_aborted;
  }
}
