#pragma once

#include <memory>
#include <utility>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <optional>

#include <boost/asio.hpp>

#include <xferwatch/http/http-body.hxx>
#include <xferwatch/progress/progress-info.hxx>
#include <xferwatch/progress/progress-traits.hxx>
#include <xferwatch/progress/progress-listener.hxx>
#include <xferwatch/progress/progress-dispatcher.hxx>

namespace xferwatch
{
  namespace asio = boost::asio;

  // Counting body decorator.
  //
  // Passes reads through to the wrapped body, counts the bytes, and posts
  // progress updates to the listener list of the transfer. Updates are
  // throttled: one is made for the first chunk, then only once at least the
  // refresh interval has passed since the previous one. The update that
  // completes the transfer (the declared length is reached or the wrapped
  // body reports the end of data) is always made, exactly once.
  //
  // If the wrapped body throws, the listeners get on_error() with the id of
  // this transfer and the exception is rethrown as is. A transfer ends with
  // either the final update or one error, never both. Nothing is posted
  // after that.
  //
  // Reads must not overlap, which is the usual requirement for a stream.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_body: public http_body
  {
  public:
    using traits_type = T;
    using clock_type  = typename traits_type::clock_type;
    using time_point  = typename clock_type::time_point;
    using list_type   = std::shared_ptr<listener_list>;

    basic_progress_body (std::shared_ptr<http_body> body,
                         list_type listeners,
                         std::shared_ptr<progress_dispatcher>,
                         transfer_direction,
                         std::chrono::milliseconds refresh_interval);

    std::optional<std::uint64_t>
    content_length () const override
    {
      return body_->content_length ();
    }

    asio::awaitable<std::size_t>
    async_read_some (asio::mutable_buffer) override;

    std::int64_t
    id () const noexcept
    {
      return id_;
    }

    transfer_direction
    direction () const noexcept
    {
      return direction_;
    }

    // Wrapped body.
    //
    const std::shared_ptr<http_body>&
    body () const noexcept
    {
      return body_;
    }

    std::uint64_t
    current_bytes () const noexcept
    {
      return current_;
    }

    bool
    finished () const noexcept
    {
      return done_;
    }

  private:
    // Account for n more bytes (0 means end of data) and post an update if
    // due.
    //
    void
    update (std::size_t n);

  private:
    std::shared_ptr<http_body> body_;
    list_type listeners_;
    std::shared_ptr<progress_dispatcher> dispatcher_;
    transfer_direction direction_;
    std::chrono::milliseconds interval_;

    std::int64_t id_;
    std::int64_t length_;   // -1 if unknown.

    std::uint64_t current_ = 0;
    std::uint64_t each_ = 0;  // Since the last update.
    time_point last_;       // Last update or construction.
    bool emitted_ = false;
    bool done_ = false;     // Final update made.
    bool failed_ = false;   // Error reported.
  };

  using progress_body = basic_progress_body<>;
}

#include <xferwatch/progress/progress-body.txx>
