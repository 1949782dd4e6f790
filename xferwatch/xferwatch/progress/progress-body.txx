#include <utility>
#include <exception>
#include <stdexcept>

namespace xferwatch
{
  template <typename T>
  basic_progress_body<T>::
  basic_progress_body (std::shared_ptr<http_body> b,
                       list_type ls,
                       std::shared_ptr<progress_dispatcher> d,
                       transfer_direction dir,
                       std::chrono::milliseconds i)
    : body_ (std::move (b)),
      listeners_ (std::move (ls)),
      dispatcher_ (std::move (d)),
      direction_ (dir),
      interval_ (i),
      id_ (next_progress_id ()),
      length_ (-1),
      last_ (clock_type::now ())
  {
    if (body_ == nullptr || listeners_ == nullptr || dispatcher_ == nullptr)
      throw std::invalid_argument (
        "progress body requires body, listeners, and dispatcher");

    if (auto n = body_->content_length ())
      length_ = static_cast<std::int64_t> (*n);
  }

  template <typename T>
  asio::awaitable<std::size_t> basic_progress_body<T>::
  async_read_some (asio::mutable_buffer b)
  {
    std::size_t n (0);

    try
    {
      n = co_await body_->async_read_some (b);
    }
    catch (...)
    {
      // Let the listeners know (unless they have already been told the
      // transfer is over) and hand the failure back to whoever is driving
      // the transfer.
      //
      if (!done_ && !failed_)
      {
        failed_ = true;
        dispatcher_->post_error (listeners_->snapshot (),
                                 id_,
                                 std::current_exception ());
      }
      throw;
    }

    // Nothing could have been read into an empty buffer, so 0 here does not
    // mean the end of data.
    //
    if (b.size () != 0)
      update (n);

    co_return n;
  }

  template <typename T>
  void basic_progress_body<T>::
  update (std::size_t n)
  {
    // Nothing more to say once the final update went out. This also covers
    // the end of data read that follows reaching the declared length.
    //
    if (done_ || failed_)
      return;

    time_point now (clock_type::now ());

    current_ += n;
    each_ += n;

    bool eof (n == 0);
    bool reached (length_ >= 0 &&
                  current_ >= static_cast<std::uint64_t> (length_));

    bool complete (eof || reached);

    if (!complete && emitted_ && now - last_ < interval_)
      return;

    // With a known length we are only finished if we actually got that many
    // bytes. A body that ends short is still the last update, just not a
    // finished one.
    //
    bool finished (length_ >= 0 ? reached : eof);

    auto ms (std::chrono::duration_cast<std::chrono::milliseconds> (
               now - last_).count ());

    std::int64_t each (eof && each_ == 0
                       ? -1
                       : static_cast<std::int64_t> (each_));

    dispatcher_->post_progress (listeners_->snapshot (),
                                progress_info (id_,
                                               length_,
                                               current_,
                                               each,
                                               static_cast<std::int64_t> (ms),
                                               finished));
    last_ = now;
    each_ = 0;
    emitted_ = true;
    done_ = complete;
  }
}
