#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <xferwatch/http/http-body.hxx>
#include <xferwatch/http/http-types.hxx>

namespace xferwatch
{
  // HTTP response.
  //
  // Besides the usual status line, headers, and body, the response remembers
  // the URL of the request it answers. This is the URL listeners are looked
  // up by and the base a relative Location is resolved against.
  //
  template <typename S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = std::shared_ptr<http_body>;
    using headers_type = basic_http_headers<string_type>;

    http_status  status = http_status::ok;
    http_version version;
    string_type  reason;
    string_type  url;
    headers_type headers;
    body_type    body;

    basic_http_response () = default;

    basic_http_response (http_status s,
                         string_type u,
                         http_version v = http_version (1, 1))
      : status (s), version (v), url (std::move (u)) {}

    basic_http_response (http_status s,
                         string_type u,
                         headers_type h,
                         body_type b,
                         http_version v = http_version (1, 1))
      : status (s),
        version (v),
        url (std::move (u)),
        headers (std::move (h)),
        body (std::move (b)) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_error () const noexcept
    {
      return status_code () >= 400;
    }

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Parsed Content-Length header, nullopt if absent or malformed.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // Location header (for redirects).
    //
    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    bool
    has_body () const noexcept
    {
      return body != nullptr;
    }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_response<S>& x, const basic_http_response<S>& y)
  {
    return x.status == y.status &&
           x.version == y.version &&
           x.reason == y.reason &&
           x.url == y.url &&
           x.headers == y.headers &&
           x.body == y.body;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_response<S>& x, const basic_http_response<S>& y)
  {
    return !(x == y);
  }

  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_response<S>& r)
  {
    o << r.version << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}

#include <xferwatch/http/http-response.ixx>
