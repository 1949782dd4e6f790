#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace xferwatch
{
  // HTTP method (verb).
  //
  enum class http_method
  {
    get,
    head,
    post,
    put,
    delete_,
    options,
    patch
  };

  std::string
  to_string (http_method);

  http_method
  to_http_method (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes we ever need to name are listed. Anything else the server
  // sends is still representable since the underlying type is the numeric
  // code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    created               = 201,
    accepted              = 202,
    no_content            = 204,
    partial_content       = 206,

    multiple_choices      = 300,
    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    forbidden             = 403,
    not_found             = 404,
    payload_too_large     = 413,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Return true if the status is one of the redirects after which the
  // client repeats the exchange against the Location target (301, 302, 303,
  // and 307).
  //
  // Note that 308 is deliberately not part of this set. Progress listeners
  // are only carried over for the classic redirect codes.
  //
  bool
  is_listener_redirect (http_status) noexcept;

  // Case-insensitive ASCII comparison for header names (RFC 7230).
  //
  bool
  iequals (const std::string&, const std::string&) noexcept;

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return !(x == y);
  }

  // HTTP headers collection.
  //
  // Order is preserved and duplicates are allowed (add()). Lookup is
  // case-insensitive.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get the first value of the field. Return nullopt if not found.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using const_iterator = typename fields_type::const_iterator;

    const_iterator begin () const noexcept { return fields.begin (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y)
  {
    return x.fields == y.fields;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_headers<S>& x, const basic_http_headers<S>& y)
  {
    return !(x == y);
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    bool
    operator!= (const http_version& v) const noexcept
    {
      return !(*this == v);
    }

    // Beast encodes the version as major * 10 + minor.
    //
    unsigned
    beast () const noexcept
    {
      return major * 10u + minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // URL components.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // scheme://host[:port], with the port omitted if it is the default one
    // for the scheme.
    //
    std::string
    origin () const;
  };

  // Split a URL of the scheme://host[:port][/target] form.
  //
  // This is not a general URI parser. IPv6 literals and user info are not
  // supported. A missing scheme defaults to http.
  //
  url_parts
  parse_url (const std::string&);

  // Resolve a Location header value against the URL of the request it was
  // returned for. Absolute locations are returned as is, scheme-relative
  // (//host/path) and origin-relative (/path) ones are completed from the
  // base. Anything else is taken relative to the base path directory.
  //
  std::string
  resolve_location (const std::string& base, const std::string& location);
}

#include <xferwatch/http/http-types.ixx>
