#pragma once

#include <memory>
#include <utility>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <iostream>
#include <optional>
#include <exception>

#include <boost/asio.hpp>

#include <xferwatch/diagnostics.hxx>
#include <xferwatch/progress/progress-traits.hxx>
#include <xferwatch/progress/progress-listener.hxx>
#include <xferwatch/progress/progress-registry.hxx>
#include <xferwatch/progress/progress-dispatcher.hxx>
#include <xferwatch/progress/progress-interceptor.hxx>

namespace xferwatch
{
  namespace asio = boost::asio;

  // Runtime options.
  //
  struct progress_manager_options
  {
    // Minimum interval between two updates of one transfer. Unset means the
    // traits default.
    //
    std::optional<std::chrono::milliseconds> refresh_interval;

    // Where warnings and traces go.
    //
    std::ostream* diagnostics = &std::cerr;

    // See diagnostics for the levels.
    //
    std::uint16_t verbosity = 0;
  };

  // Progress manager.
  //
  // Owns the listener registry, the delivery dispatcher, and the interceptor
  // that ties them to a transport. Normally there is one per process, created
  // at startup with the executor on which listeners should be called (for
  // example, the executor of the UI loop's io_context) and installed into the
  // HTTP client with with().
  //
  // All member functions are thread-safe.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_manager
  {
  public:
    using traits_type      = T;
    using string_type      = typename traits_type::string_type;
    using request_type     = typename traits_type::request_type;
    using response_type    = typename traits_type::response_type;
    using key_type         = basic_url_key<string_type>;
    using listener_type    = listener_list::listener_type;
    using registry_type    = basic_listener_registry<traits_type>;
    using interceptor_type = basic_progress_interceptor<traits_type>;
    using executor_type    = progress_dispatcher::executor_type;

    // Throw std::invalid_argument if the executor is empty.
    //
    explicit
    basic_progress_manager (executor_type,
                            const progress_manager_options& = {});

    basic_progress_manager (const basic_progress_manager&) = delete;
    basic_progress_manager& operator= (const basic_progress_manager&) = delete;

    // Track uploads (request bodies) sent to the URL. The registration lasts
    // as long as the key is referenced by somebody other than the manager.
    //
    void
    add_request_listener (const key_type& url, listener_type l)
    {
      registry_->add_request_listener (url, std::move (l));
    }

    // Track downloads (response bodies) received from the URL.
    //
    void
    add_response_listener (const key_type& url, listener_type l)
    {
      registry_->add_response_listener (url, std::move (l));
    }

    // Report a failure that happened outside of the tracked bodies (say, the
    // connection could not be established) to every request and response
    // listener of the URL. Listeners get -1 as the id.
    //
    void
    notify_error (const string_type& url, std::exception_ptr e)
    {
      registry_->notify_error (url, std::move (e));
    }

    template <typename E>
    void
    notify_error (const string_type& url, const E& e)
    {
      registry_->notify_error (url, std::make_exception_ptr (e));
    }

    // Minimum interval between two updates of one transfer. Only affects
    // transfers that start after the call.
    //
    void
    set_refresh_interval (std::chrono::milliseconds i)
    {
      interceptor_->refresh_interval (i);
    }

    std::chrono::milliseconds
    refresh_interval () const noexcept
    {
      return interceptor_->refresh_interval ();
    }

    // Install the interceptor into an HTTP client (anything with
    // add_interceptor()) and return the client.
    //
    template <typename C>
    C&
    with (C& client)
    {
      client.add_interceptor (interceptor_);
      return client;
    }

    // For transports that call the hooks themselves.
    //
    request_type
    wrap_request (request_type r)
    {
      return interceptor_->intercept_request (std::move (r));
    }

    response_type
    wrap_response (response_type r)
    {
      return interceptor_->intercept_response (std::move (r));
    }

    const std::shared_ptr<interceptor_type>&
    interceptor () const noexcept
    {
      return interceptor_;
    }

    registry_type&
    registry () noexcept
    {
      return *registry_;
    }

    diagnostics&
    diag () noexcept
    {
      return *diag_;
    }

  private:
    std::shared_ptr<diagnostics> diag_;
    std::shared_ptr<progress_dispatcher> dispatcher_;
    std::shared_ptr<registry_type> registry_;
    std::shared_ptr<interceptor_type> interceptor_;
  };

  using progress_manager = basic_progress_manager<>;
}

#include <xferwatch/progress/progress-manager.txx>
