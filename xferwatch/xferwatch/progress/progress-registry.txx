#include <initializer_list>
#include <utility>
#include <algorithm>
#include <stdexcept>

namespace xferwatch
{
  template <typename T>
  inline bool basic_listener_registry<T>::entry::
  alive () const noexcept
  {
    return std::any_of (keys.begin (), keys.end (),
                        [] (const std::weak_ptr<const string_type>& k)
                        {
                          return !k.expired ();
                        });
  }

  template <typename T>
  inline bool basic_listener_registry<T>::entry::
  prune ()
  {
    std::erase_if (keys,
                   [] (const std::weak_ptr<const string_type>& k)
                   {
                     return k.expired ();
                   });
    return !keys.empty ();
  }

  template <typename T>
  basic_listener_registry<T>::
  basic_listener_registry (std::shared_ptr<progress_dispatcher> p,
                           std::shared_ptr<diagnostics> d)
    : dispatcher_ (std::move (p)), diag_ (std::move (d))
  {
    if (dispatcher_ == nullptr || diag_ == nullptr)
      throw std::invalid_argument (
        "listener registry requires dispatcher and diagnostics");
  }

  template <typename T>
  void basic_listener_registry<T>::
  add_request_listener (const key_type& k, listener_type l)
  {
    add (requests_, k, std::move (l), "request");
  }

  template <typename T>
  void basic_listener_registry<T>::
  add_response_listener (const key_type& k, listener_type l)
  {
    add (responses_, k, std::move (l), "response");
  }

  template <typename T>
  typename basic_listener_registry<T>::list_type basic_listener_registry<T>::
  lookup_request (const string_type& u)
  {
    std::lock_guard<std::mutex> g (mutex_);
    return lookup (requests_, u);
  }

  template <typename T>
  typename basic_listener_registry<T>::list_type basic_listener_registry<T>::
  lookup_response (const string_type& u)
  {
    std::lock_guard<std::mutex> g (mutex_);
    return lookup (responses_, u);
  }

  template <typename T>
  bool basic_listener_registry<T>::
  resolve_redirect (const response_type& r)
  {
    if (!is_listener_redirect (r.status))
      return false;

    auto loc (r.location ());
    if (!loc || loc->empty ())
      return true;

    // Normalize the target to the absolute URL the client is going to
    // request next. Otherwise a relative Location would never match.
    //
    string_type to;
    try
    {
      to = resolve_location (r.url, *loc);
    }
    catch (const std::invalid_argument& e)
    {
      diag_->warning ("ignoring redirect from '" + r.url + "' to '" + *loc +
                      "': " + e.what ());
      return true;
    }

    std::lock_guard<std::mutex> g (mutex_);
    remap (requests_, r.url, to, "request");
    remap (responses_, r.url, to, "response");

    return true;
  }

  template <typename T>
  void basic_listener_registry<T>::
  notify_error (const string_type& u, std::exception_ptr e)
  {
    list_type rq;
    list_type rs;
    {
      std::lock_guard<std::mutex> g (mutex_);
      rq = lookup (requests_, u);
      rs = lookup (responses_, u);
    }

    if (rq != nullptr)
      dispatcher_->post_error (rq->snapshot (), -1, e);

    if (rs != nullptr)
      dispatcher_->post_error (rs->snapshot (), -1, e);
  }

  template <typename T>
  std::size_t basic_listener_registry<T>::
  size ()
  {
    std::lock_guard<std::mutex> g (mutex_);
    sweep (requests_);
    sweep (responses_);
    return requests_.size () + responses_.size ();
  }

  template <typename T>
  std::size_t basic_listener_registry<T>::
  key_count ()
  {
    std::lock_guard<std::mutex> g (mutex_);
    sweep (requests_);
    sweep (responses_);

    std::size_t r (0);
    for (const map_type* m: {&requests_, &responses_})
    {
      for (const auto& p: *m)
        r += p.second.keys.size ();
    }
    return r;
  }

  template <typename T>
  void basic_listener_registry<T>::
  add (map_type& m, const key_type& k, listener_type l, const char* what)
  {
    if (k == nullptr)
      throw std::invalid_argument ("null URL key");

    if (l == nullptr)
      throw std::invalid_argument ("null progress listener");

    list_type ls;
    {
      std::lock_guard<std::mutex> g (mutex_);

      sweep (requests_);
      sweep (responses_);

      entry& e (m[*k]);

      if (e.listeners == nullptr)
      {
        e.listeners = std::make_shared<listener_list> ();

        if (diag_->tracing ())
          diag_->trace (std::string ("new ") + what + " listener list for '" +
                        *k + "'");
      }

      // Several key objects may carry the same URL. Remember each of them so
      // that the entry lives as long as any does.
      //
      auto same ([&k] (const std::weak_ptr<const string_type>& w)
                 {
                   return w.lock () == k;
                 });

      // Keys come and go with whatever displays the progress while the
      // entry may be kept alive by another one for much longer.
      //
      e.prune ();

      if (std::none_of (e.keys.begin (), e.keys.end (), same))
        e.keys.push_back (k);

      ls = e.listeners;
    }

    ls->append (std::move (l));
  }

  template <typename T>
  typename basic_listener_registry<T>::list_type basic_listener_registry<T>::
  lookup (map_type& m, const string_type& u)
  {
    auto i (m.find (u));

    if (i == m.end ())
      return nullptr;

    if (!i->second.alive ())
    {
      m.erase (i);
      return nullptr;
    }

    return i->second.listeners;
  }

  template <typename T>
  void basic_listener_registry<T>::
  remap (map_type& m,
         const string_type& from,
         const string_type& to,
         const char* what)
  {
    list_type ls (lookup (m, from));

    if (ls == nullptr || from == to)
      return;

    // First registration wins: if the target has its own listeners, leave
    // them alone.
    //
    if (lookup (m, to) != nullptr)
    {
      if (diag_->tracing ())
        diag_->trace (std::string ("redirect target '") + to + "' already " +
                      "has " + what + " listeners, keeping them");
      return;
    }

    entry& f (m.find (from)->second);
    f.prune ();

    entry e;
    e.keys = f.keys;
    e.listeners = std::move (ls);

    m.insert_or_assign (to, std::move (e));

    if (diag_->tracing ())
      diag_->trace (std::string (what) + " listeners of '" + from +
                    "' follow redirect to '" + to + "'");
  }

  template <typename T>
  void basic_listener_registry<T>::
  sweep (map_type& m)
  {
    for (auto i (m.begin ()); i != m.end (); )
    {
      if (i->second.prune ())
        ++i;
      else
        i = m.erase (i);
    }
  }
}
