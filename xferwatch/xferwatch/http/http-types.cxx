#include <xferwatch/http/http-types.hxx>

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <algorithm>

using namespace std;

namespace xferwatch
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::post:    return "POST";
      case http_method::put:     return "PUT";
      case http_method::delete_: return "DELETE";
      case http_method::options: return "OPTIONS";
      case http_method::patch:   return "PATCH";
    }
    return "GET";
  }

  http_method
  to_http_method (const string& s)
  {
    string u;
    u.reserve (s.size ());
    transform (s.begin (), s.end (), back_inserter (u),
               [] (unsigned char c) {return static_cast<char> (toupper (c));});

    if (u == "GET")     return http_method::get;
    if (u == "HEAD")    return http_method::head;
    if (u == "POST")    return http_method::post;
    if (u == "PUT")     return http_method::put;
    if (u == "DELETE")  return http_method::delete_;
    if (u == "OPTIONS") return http_method::options;
    if (u == "PATCH")   return http_method::patch;

    throw invalid_argument ("invalid HTTP method: " + s);
  }

  // http_status
  //
  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::created:               return "Created";
      case http_status::accepted:              return "Accepted";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";
      case http_status::multiple_choices:      return "Multiple Choices";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::not_modified:          return "Not Modified";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::payload_too_large:     return "Payload Too Large";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return std::to_string (static_cast<uint16_t> (s));
  }

  bool
  is_listener_redirect (http_status s) noexcept
  {
    switch (s)
    {
      case http_status::moved_permanently:
      case http_status::found:
      case http_status::see_other:
      case http_status::temporary_redirect:
        return true;
      default:
        return false;
    }
  }

  bool
  iequals (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  // http_version
  //
  string http_version::
  string () const
  {
    ostringstream os;
    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);
    return os.str ();
  }

  // url_parts
  //
  static const char*
  default_port (const string& scheme)
  {
    return scheme == "https" ? "443" : "80";
  }

  string url_parts::
  origin () const
  {
    string r (scheme + "://" + host);

    if (!port.empty () && port != default_port (scheme))
      r += ':' + port;

    return r;
  }

  url_parts
  parse_url (const string& u)
  {
    url_parts r;
    size_t p (0);

    size_t s (u.find ("://"));
    if (s != string::npos)
    {
      r.scheme = u.substr (0, s);
      transform (r.scheme.begin (), r.scheme.end (), r.scheme.begin (),
                 [] (unsigned char c) {return static_cast<char> (tolower (c));});
      p = s + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the first slash or query, or at the end.
    //
    size_t e (u.find_first_of ("/?", p));
    if (e == string::npos)
      e = u.size ();

    string a (u.substr (p, e - p));
    size_t c (a.rfind (':'));

    if (c != string::npos)
    {
      r.host = a.substr (0, c);
      r.port = a.substr (c + 1);
    }
    else
    {
      r.host = move (a);
      r.port = default_port (r.scheme);
    }

    if (e < u.size ())
    {
      r.target = u.substr (e);

      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    if (r.host.empty ())
      throw invalid_argument ("invalid URL '" + u + "': missing host");

    return r;
  }

  string
  resolve_location (const string& base, const string& l)
  {
    if (l.find ("://") != string::npos)
      return l;

    url_parts b (parse_url (base));

    if (l.compare (0, 2, "//") == 0)
      return b.scheme + ':' + l;

    if (!l.empty () && l[0] == '/')
      return b.origin () + l;

    // Relative to the directory of the base path (query stripped).
    //
    string d (b.target.substr (0, b.target.find ('?')));
    d.erase (d.rfind ('/') + 1);

    return b.origin () + d + l;
  }
}
