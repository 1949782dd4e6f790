#include <xferwatch/http/http-body.hxx>

#include <algorithm>
#include <cstring>

using namespace std;

namespace xferwatch
{
  asio::awaitable<size_t> string_body::
  async_read_some (asio::mutable_buffer b)
  {
    size_t n (min (b.size (), data_.size () - pos_));

    if (n != 0)
    {
      memcpy (b.data (), data_.data () + pos_, n);
      pos_ += n;
    }

    co_return n;
  }

  asio::awaitable<string>
  async_read_all (http_body& b)
  {
    string r;

    if (auto n = b.content_length ())
      r.reserve (static_cast<size_t> (*n));

    char buf[8192];
    for (;;)
    {
      size_t n (co_await b.async_read_some (asio::buffer (buf)));

      if (n == 0)
        break;

      r.append (buf, n);
    }

    co_return r;
  }
}
