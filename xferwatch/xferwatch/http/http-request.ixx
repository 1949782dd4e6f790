namespace xferwatch
{
  template <typename S>
  inline void basic_http_request<S>::
  normalize (const string_type& ua)
  {
    if (!has_header (string_type ("Host")))
    {
      url_parts p (parse_url (url));

      // Only spell out the port if it is not the scheme default.
      //
      string_type h (p.host);
      if (p.port != (p.scheme == "https" ? "443" : "80"))
        h += ':' + p.port;

      set_header (string_type ("Host"), std::move (h));
    }

    if (!has_header (string_type ("User-Agent")) && !ua.empty ())
      set_header (string_type ("User-Agent"), ua);
  }
}
