#pragma once

#include <memory>
#include <cstddef>
#include <optional>
#include <exception>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <courier/http/http-request.hxx>
#include <courier/http/http-response.hxx>
#include <courier/http/http-transport.hxx>

#include <courier/response/response-decoder.hxx>

namespace courier
{
  namespace asio = boost::asio;

  // Builds the result of one request from the transport's event stream.
  //
  // The result is resolved when the stream ends or, for event streams, as
  // soon as the response head is in. In the latter case the result keeps
  // growing as data arrives after it has been handed out.
  //
  class response_consumer: public response_sink
  {
  public:
    response_consumer (asio::any_io_executor,
                       http_request logical,
                       std::shared_ptr<request_handle>,
                       bool decode_escaped_unicode);

    void
    on_response (const response_metadata&, const transport_request&) override;

    void
    on_data (const char*, std::size_t) override;

    void
    on_end (const timing_phases&) override;

    // Reject the completion signal. Return false if it was already settled,
    // in which case the error only marks a live stream as complete.
    //
    bool
    fail (std::exception_ptr);

    // Wait for the completion signal. Throw the rejection error, if any.
    //
    asio::awaitable<std::shared_ptr<http_response>>
    wait ();

    bool
    settled () const noexcept
    {
      return state_ != state::pending;
    }

    // Result under construction (null until the response head arrives).
    //
    const std::shared_ptr<http_response>&
    response () const noexcept
    {
      return response_;
    }

  private:
    void
    resolve ();

  private:
    enum class state {pending, resolved, rejected};

    http_request                    logical_;
    std::shared_ptr<request_handle> handle_;
    bool                            decode_unicode_;

    std::shared_ptr<http_response>    response_;
    std::optional<charset_decoder>    decoder_;
    std::optional<unicode_unescaper>  unescaper_;

    state              state_ = state::pending;
    std::exception_ptr error_;
    asio::steady_timer signal_;
  };
}
