#include <stdexcept>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace xferwatch
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline void basic_http_client<T>::
  add_interceptor (std::shared_ptr<interceptor_type> i)
  {
    if (i == nullptr)
      throw std::invalid_argument ("null HTTP interceptor");

    interceptors_.push_back (std::move (i));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type r)
  {
    r.normalize (session_->traits ().user_agent);
    co_return co_await request_impl (std::move (r), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& u)
  {
    co_return co_await request (request_type (http_method::get, u));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& u)
  {
    co_return co_await request (request_type (http_method::head, u));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  post (const string_type& u,
        std::shared_ptr<http_body> b,
        const string_type& ct)
  {
    request_type r (http_method::post, u, std::move (b));
    r.set_content_type (ct);
    co_return co_await request (std::move (r));
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  put (const string_type& u,
       std::shared_ptr<http_body> b,
       const string_type& ct)
  {
    request_type r (http_method::put, u, std::move (b));
    r.set_content_type (ct);
    co_return co_await request (std::move (r));
  }
}
