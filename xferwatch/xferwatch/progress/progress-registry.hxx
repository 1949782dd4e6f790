#pragma once

#include <mutex>
#include <memory>
#include <vector>
#include <cstddef>
#include <exception>
#include <unordered_map>

#include <xferwatch/diagnostics.hxx>
#include <xferwatch/progress/progress-traits.hxx>
#include <xferwatch/progress/progress-listener.hxx>
#include <xferwatch/progress/progress-dispatcher.hxx>

namespace xferwatch
{
  // URL to listener list registry.
  //
  // There are two independent maps, one for request (upload) listeners and
  // one for response (download) listeners. An entry stays alive for as long
  // as at least one of the keys it was registered with is referenced from
  // outside. Dead entries are swept on the next registration and skipped (and
  // dropped) by lookups.
  //
  // All structural changes of both maps (insertion, redirect remapping,
  // sweeping) are serialized by one mutex. Appending to an existing list is
  // done under the list's own lock only.
  //
  template <typename T = progress_manager_traits<>>
  class basic_listener_registry
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using response_type = typename traits_type::response_type;
    using key_type      = basic_url_key<string_type>;
    using list_type     = std::shared_ptr<listener_list>;
    using listener_type = listener_list::listener_type;

    basic_listener_registry (std::shared_ptr<progress_dispatcher>,
                             std::shared_ptr<diagnostics>);

    basic_listener_registry (const basic_listener_registry&) = delete;
    basic_listener_registry& operator= (const basic_listener_registry&) = delete;

    // Append the listener to the list for the URL, creating the list if
    // there is none. Registering the same listener twice means it will be
    // called twice.
    //
    void
    add_request_listener (const key_type&, listener_type);

    void
    add_response_listener (const key_type&, listener_type);

    // Return the list registered for the URL or null if there is none.
    //
    list_type
    lookup_request (const string_type& url);

    list_type
    lookup_response (const string_type& url);

    // If the response is a redirect (301, 302, 303, or 307), make the target
    // URL share the listener lists registered for the URL the response
    // answers, in both maps. A target that already has its own list keeps
    // it. Return true if the response is a redirect, whether or not anything
    // was remapped.
    //
    bool
    resolve_redirect (const response_type&);

    // Report an error that happened outside of any tracked body to every
    // request and response listener of the URL, with -1 as the id.
    //
    void
    notify_error (const string_type& url, std::exception_ptr);

    // Number of live entries in both maps.
    //
    std::size_t
    size ();

    // Number of key references held by the live entries of both maps.
    //
    std::size_t
    key_count ();

  private:
    struct entry
    {
      // Keys this entry is registered with. Redirect entries inherit the
      // keys of the entry they were copied from.
      //
      std::vector<std::weak_ptr<const string_type>> keys;
      list_type listeners;

      bool
      alive () const noexcept;

      // Forget expired keys. Return false if none is left.
      //
      bool
      prune ();
    };

    using map_type = std::unordered_map<string_type, entry>;

    void
    add (map_type&, const key_type&, listener_type, const char* what);

    list_type
    lookup (map_type&, const string_type&);

    void
    remap (map_type&,
           const string_type& from,
           const string_type& to,
           const char* what);

    void
    sweep (map_type&);

  private:
    std::shared_ptr<progress_dispatcher> dispatcher_;
    std::shared_ptr<diagnostics> diag_;

    std::mutex mutex_;
    map_type requests_;
    map_type responses_;
  };

  using listener_registry = basic_listener_registry<>;
}

#include <xferwatch/progress/progress-registry.txx>
