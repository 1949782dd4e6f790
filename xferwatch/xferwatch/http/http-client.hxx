#pragma once

#include <string>
#include <memory>
#include <utility>
#include <vector>
#include <cstdint>
#include <cstddef>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <xferwatch/version.hxx>
#include <xferwatch/http/http-body.hxx>
#include <xferwatch/http/http-types.hxx>
#include <xferwatch/http/http-request.hxx>
#include <xferwatch/http/http-response.hxx>
#include <xferwatch/http/http-interceptor.hxx>

namespace xferwatch
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type      = S;
    using request_type     = basic_http_request<string_type>;
    using response_type    = basic_http_response<string_type>;
    using interceptor_type = basic_http_interceptor<string_type>;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout in milliseconds for each write or read on an established
    // connection (including reads of the response body).
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Whether to automatically follow redirects.
    //
    bool follow_redirects = true;

    // Whether to verify SSL certificates.
    //
    bool verify_ssl = false;

    // SSL certificate file path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    // Default user agent (empty = do not send one).
    //
    string_type user_agent = string_type ("xferwatch/" XFERWATCH_VERSION_STR);

    // Size of the buffer used to move request body bytes to the wire.
    //
    std::size_t chunk_size = 8192;
  };

  // Per-client state shared by all exchanges.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP/1.1 client over Boost.Beast.
  //
  // Request bodies are streamed from their http_body and response bodies
  // are handed back unread: the response body pulls from the connection as
  // the caller consumes it. The connection is owned by the response body and
  // is closed when the body reaches its end or is destroyed.
  //
  // Installed interceptors see every hop of an exchange, redirects included.
  // Requests go through them in installation order, responses in reverse
  // order.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type      = T;
    using string_type      = typename traits_type::string_type;
    using request_type     = typename traits_type::request_type;
    using response_type    = typename traits_type::response_type;
    using interceptor_type = typename traits_type::interceptor_type;
    using session_type     = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Install an interceptor. Not thread-safe with respect to requests in
    // flight: install everything before issuing the first request.
    //
    void
    add_interceptor (std::shared_ptr<interceptor_type>);

    // Perform the request following redirects if enabled.
    //
    asio::awaitable<response_type>
    request (request_type);

    asio::awaitable<response_type>
    get (const string_type& url);

    asio::awaitable<response_type>
    head (const string_type& url);

    asio::awaitable<response_type>
    post (const string_type& url,
          std::shared_ptr<http_body> body,
          const string_type& content_type =
            string_type ("application/octet-stream"));

    asio::awaitable<response_type>
    put (const string_type& url,
         std::shared_ptr<http_body> body,
         const string_type& content_type =
           string_type ("application/octet-stream"));

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type, std::uint8_t redirect_count);

    // Single hop: intercept, send, read the header, intercept.
    //
    asio::awaitable<response_type>
    exchange (const request_type&);

    template <typename Stream>
    asio::awaitable<response_type>
    exchange (std::unique_ptr<Stream>,
              const request_type&,
              const url_parts&);

    template <typename Stream>
    asio::awaitable<void>
    write_request (Stream&, const request_type&, const url_parts&);

    asio::awaitable<std::unique_ptr<beast::tcp_stream>>
    connect_tcp (const url_parts&);

    asio::awaitable<std::unique_ptr<beast::ssl_stream<beast::tcp_stream>>>
    connect_ssl (const url_parts&);

  private:
    std::unique_ptr<session_type> session_;
    std::vector<std::shared_ptr<interceptor_type>> interceptors_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <xferwatch/http/http-client.ixx>
#include <xferwatch/http/http-client.txx>
