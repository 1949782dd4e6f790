#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>

namespace xferwatch
{
  namespace asio = boost::asio;

  // Message body as an asynchronous byte source.
  //
  // Both directions are modelled the same way: the transport pulls an
  // outgoing request body to put it on the wire and the application pulls an
  // incoming response body to consume it. This is what allows a decorator
  // to observe the bytes in either direction without the other side knowing.
  //
  class http_body
  {
  public:
    virtual
    ~http_body () = default;

    // Declared length in bytes or nullopt if unknown (for example, a chunked
    // response).
    //
    virtual std::optional<std::uint64_t>
    content_length () const = 0;

    // Read up to buffer_size(b) bytes into the buffer. Return 0 at the end of
    // data. Failures are reported by throwing (typically
    // boost::system::system_error).
    //
    virtual asio::awaitable<std::size_t>
    async_read_some (asio::mutable_buffer b) = 0;
  };

  // In-memory body.
  //
  class string_body: public http_body
  {
  public:
    explicit
    string_body (std::string data)
      : data_ (std::move (data)) {}

    std::optional<std::uint64_t>
    content_length () const override
    {
      return data_.size ();
    }

    asio::awaitable<std::size_t>
    async_read_some (asio::mutable_buffer) override;

    const std::string&
    data () const noexcept
    {
      return data_;
    }

  private:
    std::string data_;
    std::size_t pos_ = 0;
  };

  inline std::shared_ptr<http_body>
  make_string_body (std::string data)
  {
    return std::make_shared<string_body> (std::move (data));
  }

  // Drain the body into a string.
  //
  asio::awaitable<std::string>
  async_read_all (http_body&);
}
