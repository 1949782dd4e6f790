#pragma once

#include <memory>
#include <utility>
#include <cstdint>
#include <exception>

#include <boost/asio.hpp>

#include <xferwatch/diagnostics.hxx>
#include <xferwatch/progress/progress-info.hxx>
#include <xferwatch/progress/progress-listener.hxx>

namespace xferwatch
{
  namespace asio = boost::asio;

  // Listener callback delivery.
  //
  // Every callback is posted to a strand over the delivery executor (usually
  // the application's UI or main loop). Because the strand is serial and
  // posting is FIFO, updates coming from one transfer (which are posted from
  // one logical thread of execution) arrive in the order they were made.
  // Nothing is promised about the relative order of different transfers.
  //
  // A listener that throws is reported and skipped; the remaining listeners
  // still get the event.
  //
  class progress_dispatcher
  {
  public:
    using executor_type = asio::any_io_executor;
    using listeners_type = listener_list::snapshot_type;

    progress_dispatcher (executor_type, std::shared_ptr<diagnostics>);

    progress_dispatcher (const progress_dispatcher&) = delete;
    progress_dispatcher& operator= (const progress_dispatcher&) = delete;

    void
    post_progress (listeners_type, progress_info);

    void
    post_error (listeners_type, std::int64_t id, std::exception_ptr);

    const asio::strand<executor_type>&
    strand () const noexcept
    {
      return strand_;
    }

  private:
    asio::strand<executor_type> strand_;
    std::shared_ptr<diagnostics> diag_;
  };
}
