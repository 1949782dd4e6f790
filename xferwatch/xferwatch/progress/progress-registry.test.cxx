#include <xferwatch/progress/progress-registry.hxx>

#include <string>
#include <vector>
#include <memory>
#include <cassert>
#include <sstream>
#include <iostream>
#include <stdexcept>

#include <boost/asio.hpp>

using namespace std;
using namespace xferwatch;

namespace asio = boost::asio;

// Listener that appends "<name>:<event>" to a shared log so that we can
// check delivery order across listeners.
//
struct tagged: progress_listener
{
  string name;
  vector<string>& log;
  vector<int64_t> error_ids;

  tagged (string n, vector<string>& l): name (move (n)), log (l) {}

  void
  on_progress (const progress_info& i) override
  {
    log.push_back (name + ":progress:" + to_string (i.current_bytes ()));
  }

  void
  on_error (int64_t id, exception_ptr e) override
  {
    error_ids.push_back (id);

    try
    {
      rethrow_exception (e);
    }
    catch (const runtime_error& x)
    {
      log.push_back (name + ":error:" + x.what ());
    }
  }
};

struct throwing: progress_listener
{
  void
  on_progress (const progress_info&) override
  {
    throw runtime_error ("boom");
  }

  void
  on_error (int64_t, exception_ptr) override
  {
    throw runtime_error ("boom");
  }
};

// Throws something that is not a std::exception.
//
struct throwing_other: progress_listener
{
  void
  on_progress (const progress_info&) override
  {
    throw 42;
  }

  void
  on_error (int64_t, exception_ptr) override
  {
    throw 42;
  }
};

struct fixture
{
  asio::io_context ioc;
  ostringstream diag;
  shared_ptr<diagnostics> d;
  shared_ptr<progress_dispatcher> dispatcher;
  listener_registry registry;
  vector<string> log;

  fixture ()
    : d (make_shared<diagnostics> (diag, 1)),
      dispatcher (make_shared<progress_dispatcher> (ioc.get_executor (), d)),
      registry (dispatcher, d) {}

  void
  deliver ()
  {
    ioc.run ();
    ioc.restart ();
  }

  // Post one update to whatever is registered for the URL's responses.
  //
  void
  post (const string& url, uint64_t n)
  {
    auto ls (registry.lookup_response (url));
    assert (ls != nullptr);
    dispatcher->post_progress (ls->snapshot (),
                               progress_info (1, 100, n, n, 0, false));
  }
};

static http_response
redirect (http_status s, const string& from, const string& to)
{
  http_response r (s, from);

  if (!to.empty ())
    r.set_header ("Location", to);

  return r;
}

// Both listeners get every update, in registration order.
//
static void
test_order ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));

  f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));
  f.registry.add_response_listener (k, make_shared<tagged> ("two", f.log));

  f.post ("http://a/x", 10);
  f.post ("http://a/x", 20);
  f.deliver ();

  assert ((f.log == vector<string> {"one:progress:10",
                                    "two:progress:10",
                                    "one:progress:20",
                                    "two:progress:20"}));
}

// Registering the same listener twice is not an error, it just gets called
// twice.
//
static void
test_duplicates ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));
  auto l (make_shared<tagged> ("one", f.log));

  f.registry.add_response_listener (k, l);
  f.registry.add_response_listener (k, l);

  assert (f.registry.lookup_response ("http://a/x")->size () == 2);

  f.post ("http://a/x", 5);
  f.deliver ();

  assert (f.log.size () == 2);
}

// Upload and download registrations are independent.
//
static void
test_maps ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));

  f.registry.add_request_listener (k, make_shared<tagged> ("up", f.log));

  assert (f.registry.lookup_request ("http://a/x") != nullptr);
  assert (f.registry.lookup_response ("http://a/x") == nullptr);
  assert (f.registry.lookup_request ("http://a/y") == nullptr);
}

// Registrations go away with the last reference to their key.
//
static void
test_weak_keys ()
{
  fixture f;

  auto k (make_url_key ("http://a/x"));
  f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));
  f.registry.add_request_listener (k, make_shared<tagged> ("one", f.log));
  assert (f.registry.size () == 2);

  k.reset ();

  assert (f.registry.lookup_response ("http://a/x") == nullptr);
  assert (f.registry.lookup_request ("http://a/x") == nullptr);
  assert (f.registry.size () == 0);

  // Two keys with the same URL: the entry lives as long as either does and
  // both see the same list.
  //
  auto k1 (make_url_key ("http://a/y"));
  auto k2 (make_url_key ("http://a/y"));

  f.registry.add_response_listener (k1, make_shared<tagged> ("one", f.log));
  f.registry.add_response_listener (k2, make_shared<tagged> ("two", f.log));

  k1.reset ();
  auto ls (f.registry.lookup_response ("http://a/y"));
  assert (ls != nullptr && ls->size () == 2);

  k2.reset ();
  assert (f.registry.lookup_response ("http://a/y") == nullptr);

  // A list that is still referenced (say, by a transfer in progress) stays
  // usable after its entry is gone.
  //
  assert (ls->size () == 2);
}

// Listeners follow a redirect. The target shares the very same list.
//
static void
test_redirect ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));

  f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));
  f.registry.add_request_listener (k, make_shared<tagged> ("up", f.log));

  assert (f.registry.resolve_redirect (
            redirect (http_status::found, "http://a/x", "http://a/y")));

  assert (f.registry.lookup_response ("http://a/y") ==
          f.registry.lookup_response ("http://a/x"));
  assert (f.registry.lookup_request ("http://a/y") ==
          f.registry.lookup_request ("http://a/x"));

  // Added to the original after the redirect, still seen by the target.
  //
  f.registry.add_response_listener (k, make_shared<tagged> ("two", f.log));
  assert (f.registry.lookup_response ("http://a/y")->size () == 2);

  f.post ("http://a/y", 7);
  f.deliver ();
  assert ((f.log == vector<string> {"one:progress:7", "two:progress:7"}));

  // The target entry is anchored to the original key.
  //
  k.reset ();
  assert (f.registry.lookup_response ("http://a/y") == nullptr);
  assert (f.registry.size () == 0);
}

// All four redirect codes remap, nothing else does.
//
static void
test_redirect_codes ()
{
  for (http_status s: {http_status::moved_permanently,
                       http_status::found,
                       http_status::see_other,
                       http_status::temporary_redirect})
  {
    fixture f;
    auto k (make_url_key ("http://a/x"));
    f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));

    assert (f.registry.resolve_redirect (redirect (s, "http://a/x",
                                                   "http://a/y")));
    assert (f.registry.lookup_response ("http://a/y") != nullptr);
  }

  for (http_status s: {http_status::ok,
                       http_status::not_modified,
                       http_status::permanent_redirect,
                       http_status::not_found})
  {
    fixture f;
    auto k (make_url_key ("http://a/x"));
    f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));

    assert (!f.registry.resolve_redirect (redirect (s, "http://a/x",
                                                    "http://a/y")));
    assert (f.registry.lookup_response ("http://a/y") == nullptr);
  }
}

// The first registration of a URL wins over a redirect to it.
//
static void
test_redirect_existing ()
{
  fixture f;
  auto kx (make_url_key ("http://a/x"));
  auto ky (make_url_key ("http://a/y"));

  f.registry.add_response_listener (kx, make_shared<tagged> ("x", f.log));
  f.registry.add_response_listener (ky, make_shared<tagged> ("y", f.log));

  auto before (f.registry.lookup_response ("http://a/y"));

  assert (f.registry.resolve_redirect (
            redirect (http_status::moved_permanently,
                      "http://a/x",
                      "http://a/y")));

  assert (f.registry.lookup_response ("http://a/y") == before);

  f.post ("http://a/y", 1);
  f.deliver ();
  assert ((f.log == vector<string> {"y:progress:1"}));
}

// Redirect edge cases: no Location, an unregistered origin, and a relative
// Location.
//
static void
test_redirect_location ()
{
  fixture f;
  auto k (make_url_key ("http://a:8080/p/x?q=1"));
  f.registry.add_response_listener (k, make_shared<tagged> ("one", f.log));

  // Still a redirect, just nowhere to go.
  //
  assert (f.registry.resolve_redirect (
            redirect (http_status::found, "http://a:8080/p/x?q=1", "")));
  assert (f.registry.size () == 1);

  // Nothing registered for the origin.
  //
  assert (f.registry.resolve_redirect (
            redirect (http_status::found, "http://b/x", "http://b/y")));
  assert (f.registry.lookup_response ("http://b/y") == nullptr);

  // Relative locations are resolved against the request URL.
  //
  assert (f.registry.resolve_redirect (
            redirect (http_status::found, "http://a:8080/p/x?q=1", "/z")));
  assert (f.registry.lookup_response ("http://a:8080/z") != nullptr);

  assert (f.registry.resolve_redirect (
            redirect (http_status::see_other, "http://a:8080/p/x?q=1", "w")));
  assert (f.registry.lookup_response ("http://a:8080/p/w") != nullptr);
}

// One listener on both maps hears about an out of band error twice, with -1
// as the id.
//
static void
test_notify_error ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));
  auto l (make_shared<tagged> ("one", f.log));

  f.registry.add_request_listener (k, l);
  f.registry.add_response_listener (k, l);

  f.registry.notify_error ("http://a/x",
                           make_exception_ptr (runtime_error ("refused")));

  // Unknown URL: nobody to tell.
  //
  f.registry.notify_error ("http://a/y",
                           make_exception_ptr (runtime_error ("refused")));
  f.deliver ();

  assert ((l->error_ids == vector<int64_t> {-1, -1}));
  assert ((f.log == vector<string> {"one:error:refused",
                                    "one:error:refused"}));
}

// A failing listener does not stop the delivery to the others.
//
static void
test_isolation ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));
  auto l (make_shared<tagged> ("after", f.log));

  f.registry.add_response_listener (k, make_shared<throwing> ());
  f.registry.add_response_listener (k, make_shared<throwing_other> ());
  f.registry.add_response_listener (k, l);

  f.post ("http://a/x", 3);
  f.registry.notify_error ("http://a/x",
                           make_exception_ptr (runtime_error ("oops")));
  f.deliver ();

  assert ((f.log == vector<string> {"after:progress:3", "after:error:oops"}));

  string d (f.diag.str ());
  assert (d.find ("warning: progress listener failed on update") !=
          string::npos);
  assert (d.find ("warning: progress listener failed on error") !=
          string::npos);
  assert (d.find ("failed on update of transfer #1: unknown exception") !=
          string::npos);
  assert (d.find ("failed on error of transfer #-1: unknown exception") !=
          string::npos);
}

// Registrations with short-lived keys under a long-lived one for the same
// URL do not accumulate.
//
static void
test_key_churn ()
{
  fixture f;
  auto k (make_url_key ("http://a/x"));
  f.registry.add_response_listener (k, make_shared<tagged> ("long", f.log));

  for (size_t i (0); i != 1000; ++i)
  {
    auto t (make_url_key ("http://a/x"));
    f.registry.add_response_listener (t, make_shared<tagged> ("short", f.log));
    assert (f.registry.key_count () == 2);
  }

  assert (f.registry.key_count () == 1);
  assert (f.registry.size () == 1);

  // Same for an entry copied by a redirect: it only inherits the keys that
  // are still alive.
  //
  {
    auto t (make_url_key ("http://a/x"));
    f.registry.add_response_listener (t, make_shared<tagged> ("short", f.log));
  }

  assert (f.registry.resolve_redirect (
            redirect (http_status::found, "http://a/x", "http://a/y")));
  assert (f.registry.key_count () == 2);
  assert (f.registry.size () == 2);

  k.reset ();
  assert (f.registry.key_count () == 0);
  assert (f.registry.size () == 0);
}

static void
test_invalid ()
{
  fixture f;

  try
  {
    f.registry.add_response_listener (nullptr,
                                      make_shared<tagged> ("one", f.log));
    assert (false);
  }
  catch (const invalid_argument&) {}

  try
  {
    f.registry.add_response_listener (make_url_key ("http://a/x"), nullptr);
    assert (false);
  }
  catch (const invalid_argument&) {}
}

int
main ()
{
  test_order ();
  test_duplicates ();
  test_maps ();
  test_weak_keys ();
  test_redirect ();
  test_redirect_codes ();
  test_redirect_existing ();
  test_redirect_location ();
  test_notify_error ();
  test_isolation ();
  test_key_churn ();
  test_invalid ();
}
