#pragma once

#include <string>
#include <memory>
#include <utility>
#include <ostream>
#include <optional>

#include <xferwatch/http/http-body.hxx>
#include <xferwatch/http/http-types.hxx>

namespace xferwatch
{
  // HTTP request.
  //
  // The body is shared rather than owned so that an interceptor can replace
  // it with a decorator while the original stays alive underneath. A null
  // body means the request has none.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = std::shared_ptr<http_body>;
    using headers_type = basic_http_headers<string_type>;

    http_method  method = http_method::get;
    string_type  url;
    http_version version;
    headers_type headers;
    body_type    body;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    basic_http_request (http_method m,
                        string_type u,
                        body_type b,
                        http_version v = http_version (1, 1))
        : method (m),
          url (std::move (u)),
          version (v),
          body (std::move (b)) {}

    // Request target (path and query of the URL).
    //
    string_type
    target () const
    {
      return parse_url (url).target;
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

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_content_type (string_type ct)
    {
      set_header (string_type ("Content-Type"), std::move (ct));
    }

    bool
    has_body () const noexcept
    {
      return body != nullptr;
    }

    // Add the Host and User-Agent headers if missing.
    //
    // Content-Length is not added here: the body may be replaced by an
    // interceptor before it is sent, so the transport takes the length from
    // whatever body it ends up writing.
    //
    void
    normalize (const string_type& user_agent);
  };

  // Note that bodies compare by identity: two requests are only equal if
  // they share the very same body object.
  //
  template <typename S>
  inline bool
  operator== (const basic_http_request<S>& x, const basic_http_request<S>& y)
  {
    return x.method == y.method &&
           x.url == y.url &&
           x.version == y.version &&
           x.headers == y.headers &&
           x.body == y.body;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_request<S>& x, const basic_http_request<S>& y)
  {
    return !(x == y);
  }

  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_request<S>& r)
  {
    return o << r.method << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <xferwatch/http/http-request.ixx>
