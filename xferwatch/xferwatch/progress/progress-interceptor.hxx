#pragma once

#include <atomic>
#include <memory>
#include <chrono>

#include <xferwatch/diagnostics.hxx>
#include <xferwatch/progress/progress-body.hxx>
#include <xferwatch/progress/progress-traits.hxx>
#include <xferwatch/progress/progress-registry.hxx>
#include <xferwatch/progress/progress-dispatcher.hxx>

namespace xferwatch
{
  // Per-exchange orchestration.
  //
  // Wraps the request body in an upload progress body if the request URL has
  // request listeners. On the way back, carries the listeners of a
  // redirected URL over to the redirect target (leaving the redirect
  // response itself alone) or wraps the response body in a download progress
  // body if the URL has response listeners. Anything without listeners goes
  // through untouched.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_interceptor: public T::interceptor_type
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using registry_type = basic_listener_registry<traits_type>;
    using body_type     = basic_progress_body<traits_type>;

    basic_progress_interceptor (std::shared_ptr<registry_type>,
                                std::shared_ptr<progress_dispatcher>,
                                std::shared_ptr<diagnostics>,
                                std::chrono::milliseconds refresh_interval);

    request_type
    intercept_request (request_type) override;

    response_type
    intercept_response (response_type) override;

    // Refresh interval for bodies wrapped from now on. Transfers already in
    // progress keep the interval they started with.
    //
    void
    refresh_interval (std::chrono::milliseconds);

    std::chrono::milliseconds
    refresh_interval () const noexcept
    {
      return std::chrono::milliseconds (
        interval_.load (std::memory_order_relaxed));
    }

  private:
    std::shared_ptr<registry_type> registry_;
    std::shared_ptr<progress_dispatcher> dispatcher_;
    std::shared_ptr<diagnostics> diag_;
    std::atomic<std::chrono::milliseconds::rep> interval_;
  };

  using progress_interceptor = basic_progress_interceptor<>;
}

#include <xferwatch/progress/progress-interceptor.txx>
