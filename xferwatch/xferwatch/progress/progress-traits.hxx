#pragma once

#include <string>
#include <memory>
#include <chrono>

#include <xferwatch/http/http-request.hxx>
#include <xferwatch/http/http-response.hxx>
#include <xferwatch/http/http-interceptor.hxx>

namespace xferwatch
{
  // Progress manager traits.
  //
  // The clock is a customization point mostly for tests, which need to
  // control the passage of time to check the update throttling. It must
  // satisfy the Clock requirements and be safe to call from any thread.
  //
  template <typename S = std::string>
  struct progress_manager_traits
  {
    using string_type      = S;
    using clock_type       = std::chrono::steady_clock;
    using request_type     = basic_http_request<string_type>;
    using response_type    = basic_http_response<string_type>;
    using interceptor_type = basic_http_interceptor<string_type>;

    // Default minimum interval between two updates of one transfer.
    //
    static constexpr int refresh_interval_ms = 150;
  };

  // Registration key.
  //
  // The registry only keeps a weak reference to the key, so the registration
  // lasts for as long as the caller (or anybody else) holds on to it. Tie it
  // to the lifetime of whatever displays the progress and the listeners go
  // away with it, with no explicit unregistration.
  //
  template <typename S>
  using basic_url_key = std::shared_ptr<const S>;

  using url_key = basic_url_key<std::string>;

  template <typename S>
  inline basic_url_key<S>
  make_url_key (S url)
  {
    return std::make_shared<const S> (std::move (url));
  }

  inline url_key
  make_url_key (const char* url)
  {
    return make_url_key (std::string (url));
  }
}
