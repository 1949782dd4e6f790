#include <xferwatch/xferwatch.hxx>

#include <string>
#include <vector>
#include <memory>
#include <cassert>
#include <cstring>
#include <sstream>
#include <iostream>
#include <optional>
#include <algorithm>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;
using namespace xferwatch;

namespace asio  = boost::asio;
namespace beast = boost::beast;

// Loopback server.
//
// One request per connection. Routes:
//
// POST /upload  200 with the number of body bytes received (PUT too)
// GET  /old     302 to /new
// POST /temp    307 to /upload
// GET  /new     200 with 64KiB (HEAD: the header only)
//
// Anything else is 404.
//
static const size_t download_size (64 * 1024);

static asio::awaitable<void>
handle (asio::ip::tcp::socket s)
{
  beast::flat_buffer b;
  beast::http::request<beast::http::string_body> rq;

  co_await beast::http::async_read (s, b, rq, asio::use_awaitable);

  if (rq.method () == beast::http::verb::head)
  {
    beast::http::response<beast::http::empty_body> rs (
      rq.target () == "/new"
      ? beast::http::status::ok
      : beast::http::status::not_found,
      11);

    rs.keep_alive (false);
    rs.content_length (rq.target () == "/new" ? download_size : 0);

    co_await beast::http::async_write (s, rs, asio::use_awaitable);

    beast::error_code ec;
    s.shutdown (asio::ip::tcp::socket::shutdown_send, ec);
    co_return;
  }

  beast::http::response<beast::http::string_body> rs;
  rs.version (11);
  rs.keep_alive (false);

  const auto t (rq.target ());

  if (t == "/upload" && (rq.method () == beast::http::verb::post ||
                         rq.method () == beast::http::verb::put))
  {
    rs.result (beast::http::status::ok);
    rs.body () = to_string (rq.body ().size ());
  }
  else if (t == "/old")
  {
    rs.result (beast::http::status::found);
    rs.set (beast::http::field::location, "/new");
    rs.body () = "moved";
  }
  else if (t == "/temp")
  {
    rs.result (beast::http::status::temporary_redirect);
    rs.set (beast::http::field::location, "/upload");
  }
  else if (t == "/new" && rq.method () == beast::http::verb::get)
  {
    rs.result (beast::http::status::ok);
    rs.body () = string (download_size, 'd');
  }
  else
    rs.result (beast::http::status::not_found);

  rs.prepare_payload ();
  co_await beast::http::async_write (s, rs, asio::use_awaitable);

  beast::error_code ec;
  s.shutdown (asio::ip::tcp::socket::shutdown_send, ec);
}

static asio::awaitable<void>
serve (asio::ip::tcp::acceptor& a)
{
  for (;;)
  {
    beast::error_code ec;
    asio::ip::tcp::socket s (
      co_await a.async_accept (asio::redirect_error (asio::use_awaitable,
                                                     ec)));

    // Closed by the test when it is done.
    //
    if (ec)
      co_return;

    asio::co_spawn (a.get_executor (), handle (move (s)), asio::detached);
  }
}

struct recorder: progress_listener
{
  vector<progress_info> updates;
  vector<int64_t> errors;

  void
  on_progress (const progress_info& i) override
  {
    updates.push_back (i);
  }

  void
  on_error (int64_t id, exception_ptr) override
  {
    errors.push_back (id);
  }

  void
  check_complete (uint64_t n) const
  {
    assert (!updates.empty ());

    for (size_t i (1); i < updates.size (); ++i)
      assert (updates[i].current_bytes () >= updates[i - 1].current_bytes ());

    assert (updates.back ().finished ());
    assert (updates.back ().current_bytes () == n);

    assert (count_if (updates.begin (), updates.end (),
                      [] (const progress_info& i) {return i.finished ();}) ==
            1);
  }
};

// Body of unknown length so that the request goes out chunked.
//
class stream_body: public http_body
{
public:
  explicit
  stream_body (size_t size): size_ (size) {}

  optional<uint64_t>
  content_length () const override
  {
    return nullopt;
  }

  asio::awaitable<size_t>
  async_read_some (asio::mutable_buffer b) override
  {
    size_t n (min (b.size (), size_ - pos_));
    memset (b.data (), 's', n);
    pos_ += n;
    co_return n;
  }

private:
  size_t size_;
  size_t pos_ = 0;
};

struct fixture
{
  asio::io_context ioc;
  asio::ip::tcp::acceptor acceptor;
  ostringstream diag;
  progress_manager manager;
  http_client client;
  string base;

  fixture ()
    : acceptor (ioc,
                asio::ip::tcp::endpoint (asio::ip::make_address ("127.0.0.1"),
                                         0)),
      manager (ioc.get_executor (), options (diag)),
      client (ioc)
  {
    base = "http://127.0.0.1:" +
           to_string (acceptor.local_endpoint ().port ());

    manager.with (client);
    asio::co_spawn (ioc, serve (acceptor), asio::detached);
  }

  static progress_manager_options
  options (ostringstream& d)
  {
    progress_manager_options o;
    o.refresh_interval = chrono::milliseconds (0);
    o.diagnostics = &d;
    o.verbosity = 1;
    return o;
  }

  // Run the test body as a coroutine, then stop the server and deliver all
  // the outstanding updates.
  //
  template <typename F>
  void
  run (F f)
  {
    exception_ptr ep;

    asio::co_spawn (ioc,
                    [f] () -> asio::awaitable<void>
                    {
                      co_await f ();
                    },
                    [this, &ep] (exception_ptr e)
                    {
                      ep = e;

                      beast::error_code ec;
                      acceptor.close (ec);
                    });
    ioc.run ();
    ioc.restart ();

    if (ep)
      rethrow_exception (ep);
  }
};

// Upload with a known length.
//
static void
test_upload ()
{
  fixture f;
  auto k (make_url_key (f.base + "/upload"));
  auto up (make_shared<recorder> ());
  f.manager.add_request_listener (k, up);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (
      co_await f.client.post (f.base + "/upload",
                              make_string_body (string (100000, 'u'))));

    assert (r.status == http_status::ok);
    assert (r.body != nullptr);

    // Nobody listens to this response.
    //
    assert (dynamic_pointer_cast<progress_body> (r.body) == nullptr);
    string s (co_await async_read_all (*r.body));
    assert (s == "100000");
  });

  up->check_complete (100000);
  assert (up->updates.back ().content_length () == 100000);
  assert (up->updates.back ().percent () == 100);
  assert (up->errors.empty ());

  // The client moves the body in chunk_size pieces.
  //
  assert (up->updates.size () > 1);
}

// Upload with an unknown length goes out chunked and finishes on the end of
// data.
//
static void
test_upload_chunked ()
{
  fixture f;
  auto k (make_url_key (f.base + "/upload"));
  auto up (make_shared<recorder> ());
  f.manager.add_request_listener (k, up);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (
      co_await f.client.post (f.base + "/upload",
                              make_shared<stream_body> (20000)));

    assert (r.status == http_status::ok);
    string s (co_await async_read_all (*r.body));
    assert (s == "20000");
  });

  up->check_complete (20000);
  assert (!up->updates.back ().known_length ());
  assert (up->updates.back ().each_bytes () == -1);
}

// The listener registered for the old URL tracks the download from the URL
// it redirects to.
//
static void
test_download_redirect ()
{
  fixture f;
  auto k (make_url_key (f.base + "/old"));
  auto down (make_shared<recorder> ());
  f.manager.add_response_listener (k, down);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (co_await f.client.get (f.base + "/old"));

    assert (r.status == http_status::ok);
    assert (r.url == f.base + "/new");
    assert (r.content_length () == download_size);

    auto pb (dynamic_pointer_cast<progress_body> (r.body));
    assert (pb != nullptr);
    assert (pb->direction () == transfer_direction::download);

    string s (co_await async_read_all (*r.body));
    assert (s.size () == download_size);
  });

  down->check_complete (download_size);
  assert (down->updates.back ().content_length () ==
          static_cast<int64_t> (download_size));

  // Nothing was reported for the redirect response body.
  //
  for (const auto& i: down->updates)
    assert (i.content_length () == static_cast<int64_t> (download_size));

  assert (f.manager.registry ().lookup_response (f.base + "/new") != nullptr);
}

// POST followed by a 302 turns into a body-less GET. A 307 would require
// sending the body again, which a streamed body cannot do.
//
static void
test_redirect_methods ()
{
  fixture f;

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (
      co_await f.client.post (f.base + "/old", make_string_body ("data")));

    assert (r.status == http_status::ok);
    string s (co_await async_read_all (*r.body));
    assert (s.size () == download_size);

    try
    {
      co_await f.client.post (f.base + "/temp", make_string_body ("data"));
      assert (false);
    }
    catch (const runtime_error& e)
    {
      assert (string (e.what ()).find ("cannot replay") != string::npos);
    }
  });
}

static void
test_not_found ()
{
  fixture f;
  auto k (make_url_key (f.base + "/missing"));
  auto down (make_shared<recorder> ());
  f.manager.add_response_listener (k, down);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (co_await f.client.get (f.base + "/missing"));
    assert (r.status == http_status::not_found);
    assert (r.is_error ());

    // Empty body: the exchange is complete with the header.
    //
    assert (r.body == nullptr);
  });

  assert (down->updates.empty ());
}

// A failure before any body is involved is for the application to report.
//
static void
test_connect_error ()
{
  fixture f;

  string url;
  {
    asio::ip::tcp::acceptor a (
      f.ioc,
      asio::ip::tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0));

    url = "http://127.0.0.1:" + to_string (a.local_endpoint ().port ()) +
          "/gone";
  }

  auto k (make_url_key (url));
  auto r (make_shared<recorder> ());
  f.manager.add_request_listener (k, r);
  f.manager.add_response_listener (k, r);

  f.run ([&f, &url] () -> asio::awaitable<void>
  {
    try
    {
      co_await f.client.get (url);
      assert (false);
    }
    catch (const boost::system::system_error&)
    {
      f.manager.notify_error (url, current_exception ());
    }
  });

  assert ((r->errors == vector<int64_t> {-1, -1}));
  assert (r->updates.empty ());
}

static void
test_put ()
{
  fixture f;
  auto k (make_url_key (f.base + "/upload"));
  auto up (make_shared<recorder> ());
  f.manager.add_request_listener (k, up);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (
      co_await f.client.put (f.base + "/upload",
                             make_string_body (string (3000, 'p')),
                             "text/plain"));

    assert (r.status == http_status::ok);
    string s (co_await async_read_all (*r.body));
    assert (s == "3000");
  });

  up->check_complete (3000);
}

// HEAD gets the length of what GET would return, without a body to track.
//
static void
test_head ()
{
  fixture f;
  auto k (make_url_key (f.base + "/new"));
  auto down (make_shared<recorder> ());
  f.manager.add_response_listener (k, down);

  f.run ([&f] () -> asio::awaitable<void>
  {
    http_response r (co_await f.client.head (f.base + "/new"));

    assert (r.status == http_status::ok);
    assert (r.content_length () == download_size);
    assert (r.body == nullptr);
  });

  assert (down->updates.empty ());
}

// TLS: the client configuration honours the certificate settings and the
// https scheme goes through the TLS handshake. A plain HTTP server on the
// other end fails the handshake.
//
static void
test_tls ()
{
  // Default traits: no verification, user agent with our version.
  //
  {
    http_client_traits<> tr;
    assert (!tr.verify_ssl);
    assert (tr.user_agent == string ("xferwatch/") + XFERWATCH_VERSION_STR);
  }

  // Verification with a certificate file that does not exist.
  //
  {
    asio::io_context ioc;

    http_client_traits<> tr;
    tr.verify_ssl = true;
    tr.ssl_cert_file = "/nonexistent/xferwatch-test-ca.pem";

    try
    {
      http_client c (ioc, tr);
      assert (false);
    }
    catch (const boost::system::system_error&) {}
  }

  fixture f;
  string url ("https://127.0.0.1:" +
              to_string (f.acceptor.local_endpoint ().port ()) + "/new");

  auto k (make_url_key (url));
  auto r (make_shared<recorder> ());
  f.manager.add_response_listener (k, r);

  f.run ([&f, &url] () -> asio::awaitable<void>
  {
    bool thrown (false);

    try
    {
      co_await f.client.get (url);
    }
    catch (const boost::system::system_error&)
    {
      thrown = true;
    }

    assert (thrown);
  });

  assert (r->updates.empty ());
}

int
main ()
{
  test_upload ();
  test_upload_chunked ();
  test_download_redirect ();
  test_redirect_methods ();
  test_not_found ();
  test_connect_error ();
  test_put ();
  test_head ();
  test_tls ();
}
