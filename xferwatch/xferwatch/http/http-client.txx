#include <chrono>
#include <limits>
#include <vector>
#include <utility>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace xferwatch
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return http::verb::get;
      case http_method::head:    return http::verb::head;
      case http_method::post:    return http::verb::post;
      case http_method::put:     return http::verb::put;
      case http_method::delete_: return http::verb::delete_;
      case http_method::options: return http::verb::options;
      case http_method::patch:   return http::verb::patch;
    }
    return http::verb::get;
  }

  // Connection shutdown.
  //
  // Errors are ignored on purpose: plenty of servers just drop the TCP
  // connection after the last byte without a proper TLS close_notify, and by
  // now the exchange has already succeeded.
  //
  inline asio::awaitable<void>
  async_shutdown_stream (beast::tcp_stream& s)
  {
    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    co_return;
  }

  inline asio::awaitable<void>
  async_shutdown_stream (beast::ssl_stream<beast::tcp_stream>& s)
  {
    beast::error_code ec;
    co_await s.async_shutdown (asio::redirect_error (asio::use_awaitable, ec));
  }

  // Response body that pulls from the connection it arrived on.
  //
  // Owns the stream, the read buffer (which may already hold body bytes read
  // together with the header), and the parser. The connection is shut down
  // once the parser reports the message complete.
  //
  template <typename Stream>
  class basic_connection_body: public http_body
  {
  public:
    using stream_type = Stream;
    using parser_type = http::response_parser<http::buffer_body>;

    basic_connection_body (std::unique_ptr<stream_type> s,
                           std::unique_ptr<beast::flat_buffer> b,
                           std::unique_ptr<parser_type> p,
                           std::chrono::milliseconds timeout)
      : stream_ (std::move (s)),
        buffer_ (std::move (b)),
        parser_ (std::move (p)),
        timeout_ (timeout)
    {
      if (auto n = parser_->content_length ())
        length_ = *n;
    }

    std::optional<std::uint64_t>
    content_length () const override
    {
      return length_;
    }

    asio::awaitable<std::size_t>
    async_read_some (asio::mutable_buffer b) override
    {
      if (b.size () == 0)
        throw std::invalid_argument ("empty body read buffer");

      // A read may consume only framing (say, a chunk header) without
      // producing any body bytes, so keep going until we either have some
      // or the message is complete.
      //
      for (;;)
      {
        if (stream_ == nullptr)
          co_return 0;

        if (parser_->is_done ())
        {
          co_await async_shutdown_stream (*stream_);
          stream_.reset ();
          co_return 0;
        }

        auto& body (parser_->get ().body ());
        body.data = b.data ();
        body.size = b.size ();

        beast::get_lowest_layer (*stream_).expires_after (timeout_);

        beast::error_code ec;
        co_await http::async_read_some (
          *stream_, *buffer_, *parser_,
          asio::redirect_error (asio::use_awaitable, ec));

        if (ec == http::error::need_buffer)
          ec = {};

        if (ec)
          throw beast::system_error (ec);

        std::size_t n (b.size () - body.size);
        if (n != 0)
          co_return n;
      }
    }

  private:
    std::unique_ptr<stream_type> stream_;
    std::unique_ptr<beast::flat_buffer> buffer_;
    std::unique_ptr<parser_type> parser_;
    std::chrono::milliseconds timeout_;
    std::optional<std::uint64_t> length_;
  };

  // Follow redirects.
  //
  // Each hop is a separate exchange (and therefore separately intercepted).
  // The redirect response itself is dropped together with its connection.
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    response_type r (co_await exchange (req));

    if (!tr.follow_redirects || !r.is_redirection ())
      co_return r;

    auto loc (r.location ());
    if (!loc || loc->empty ())
      co_return r;

    if (redirect_count >= tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded");

    request_type next (req.method,
                       resolve_location (req.url, *loc),
                       req.version);

    next.headers = req.headers;
    next.headers.remove (string_type ("Host"));

    // For 303 See Other we must switch to GET and drop the body (RFC 7231).
    // For 301 and 302 after a POST we do the same thing every browser does.
    //
    // A 307/308 requires replaying the body as is, which we cannot do with a
    // streamed body that has already been consumed.
    //
    bool drop (r.status == http_status::see_other ||
               (req.method == http_method::post &&
                (r.status == http_status::moved_permanently ||
                 r.status == http_status::found)));

    if (drop)
    {
      if (next.method != http_method::head)
        next.method = http_method::get;

      next.body = nullptr;
      next.headers.remove (string_type ("Content-Type"));
    }
    else if (req.has_body ())
      throw std::runtime_error ("cannot replay request body on HTTP " +
                                std::to_string (r.status_code ()) +
                                " redirect to " + next.url);

    next.normalize (tr.user_agent);

    r.body.reset ();

    co_return co_await request_impl (
      std::move (next), static_cast<std::uint8_t> (redirect_count + 1));
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (const request_type& req)
  {
    request_type out (req);

    for (const auto& i: interceptors_)
      out = i->intercept_request (std::move (out));

    url_parts parts (parse_url (out.url));
    response_type r;

    if (parts.scheme == "https")
    {
      auto s (co_await connect_ssl (parts));
      r = co_await exchange (std::move (s), out, parts);
    }
    else if (parts.scheme == "http")
    {
      auto s (co_await connect_tcp (parts));
      r = co_await exchange (std::move (s), out, parts);
    }
    else
      throw std::invalid_argument ("unsupported URL scheme '" +
                                   parts.scheme + "'");

    for (auto i (interceptors_.rbegin ()); i != interceptors_.rend (); ++i)
      r = (*i)->intercept_response (std::move (r));

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (std::unique_ptr<Stream> s,
            const request_type& req,
            const url_parts& parts)
  {
    using parser_type = typename basic_connection_body<Stream>::parser_type;

    const auto& tr (session_->traits ());
    std::chrono::milliseconds timeout (tr.request_timeout);

    co_await write_request (*s, req, parts);

    // Read the header only. Whatever body bytes come along with it stay in
    // the buffer, which is why the buffer travels with the body.
    //
    auto b (std::make_unique<beast::flat_buffer> ());
    auto p (std::make_unique<parser_type> ());
    p->body_limit (std::numeric_limits<std::uint64_t>::max ());

    if (req.method == http_method::head)
      p->skip (true);

    beast::get_lowest_layer (*s).expires_after (timeout);
    co_await http::async_read_header (*s, *b, *p, asio::use_awaitable);

    response_type r;
    {
      const auto& h (p->get ());

      r.status  = static_cast<http_status> (h.result_int ());
      r.version = http_version (static_cast<std::uint8_t> (h.version () / 10),
                                static_cast<std::uint8_t> (h.version () % 10));
      r.reason  = string_type (h.reason ());
      r.url     = req.url;

      for (const auto& f: h)
        r.headers.add (string_type (f.name_string ()),
                       string_type (f.value ()));
    }

    if (p->is_done ())
      co_await async_shutdown_stream (*s);
    else
      r.body = std::make_shared<basic_connection_body<Stream>> (
        std::move (s), std::move (b), std::move (p), timeout);

    co_return r;
  }

  // Stream the request body with a buffer_body serializer: write the header
  // first, then one chunk at a time as the body produces it.
  //
  template <typename T>
  template <typename Stream>
  asio::awaitable<void>
  basic_http_client<T>::
  write_request (Stream& s, const request_type& req, const url_parts& parts)
  {
    const auto& tr (session_->traits ());

    http::request<http::buffer_body> br;
    br.method (to_beast_verb (req.method));
    br.target (parts.target);
    br.version (req.version.beast ());

    for (const auto& h: req.headers)
    {
      if (iequals (h.name, "Content-Length") ||
          iequals (h.name, "Transfer-Encoding"))
        continue;

      br.set (h.name, h.value);
    }

    http_body* body (req.body.get ());

    if (body != nullptr)
    {
      if (auto n = body->content_length ())
        br.content_length (*n);
      else
        br.chunked (true);
    }
    else if (req.method == http_method::post ||
             req.method == http_method::put ||
             req.method == http_method::patch)
      br.content_length (0);

    br.body ().data = nullptr;
    br.body ().more = body != nullptr;

    http::request_serializer<http::buffer_body> sr (br);

    beast::get_lowest_layer (s).expires_after (
      std::chrono::milliseconds (tr.request_timeout));

    co_await http::async_write_header (s, sr, asio::use_awaitable);

    std::vector<char> buf (body != nullptr ? tr.chunk_size : 0);

    while (!sr.is_done ())
    {
      std::size_t n (0);

      if (body != nullptr)
        n = co_await body->async_read_some (asio::buffer (buf));

      if (n != 0)
      {
        br.body ().data = buf.data ();
        br.body ().size = n;
        br.body ().more = true;
      }
      else
      {
        br.body ().data = nullptr;
        br.body ().size = 0;
        br.body ().more = false;
      }

      beast::get_lowest_layer (s).expires_after (
        std::chrono::milliseconds (tr.request_timeout));

      beast::error_code ec;
      co_await http::async_write (
        s, sr, asio::redirect_error (asio::use_awaitable, ec));

      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec);
    }
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<beast::tcp_stream>>
  basic_http_client<T>::
  connect_tcp (const url_parts& parts)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    auto s (std::make_unique<beast::tcp_stream> (ctx));

    s->expires_after (std::chrono::milliseconds (tr.connect_timeout));
    co_await s->async_connect (addrs, asio::use_awaitable);

    co_return std::move (s);
  }

  template <typename T>
  asio::awaitable<std::unique_ptr<beast::ssl_stream<beast::tcp_stream>>>
  basic_http_client<T>::
  connect_ssl (const url_parts& parts)
  {
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    auto s (std::make_unique<stream_type> (ctx, session_->ssl_context ()));

    // Beast does not wrap SNI so we have to go down to the OpenSSL API. If
    // this fails, the handshake would most likely get the wrong certificate
    // anyway.
    //
    if (!SSL_set_tlsext_host_name (s->native_handle (), parts.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "failed to set SNI hostname");
    }

    auto& layer (beast::get_lowest_layer (*s));

    layer.expires_after (std::chrono::milliseconds (tr.connect_timeout));
    co_await layer.async_connect (addrs, asio::use_awaitable);

    co_await s->async_handshake (ssl::stream_base::client,
                                 asio::use_awaitable);

    co_return std::move (s);
  }
}
