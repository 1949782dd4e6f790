#pragma once

#include <string>

#include <xferwatch/http/http-request.hxx>
#include <xferwatch/http/http-response.hxx>

namespace xferwatch
{
  // Transport hook.
  //
  // The client calls intercept_request() right before a request goes on the
  // wire and intercept_response() right after the response header has been
  // read, before anybody has consumed the body. Both are called exactly once
  // per exchange, which with redirects means once per hop.
  //
  // Both functions may be called concurrently for unrelated exchanges.
  //
  template <typename S>
  class basic_http_interceptor
  {
  public:
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    virtual
    ~basic_http_interceptor () = default;

    virtual request_type
    intercept_request (request_type) = 0;

    virtual response_type
    intercept_response (response_type) = 0;
  };

  using http_interceptor = basic_http_interceptor<std::string>;
}
