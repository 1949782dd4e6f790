#pragma once

#include <mutex>
#include <memory>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <exception>
#include <functional>

#include <xferwatch/progress/progress-info.hxx>

namespace xferwatch
{
  // Progress observer.
  //
  // Callbacks are always made on the manager's delivery executor, one at a
  // time, so implementations need no synchronization of their own.
  //
  class progress_listener
  {
  public:
    virtual
    ~progress_listener () = default;

    virtual void
    on_progress (const progress_info&) = 0;

    // The id is that of the failed transfer or -1 if the error was reported
    // out of band (see notify_error()).
    //
    virtual void
    on_error (std::int64_t id, std::exception_ptr) = 0;
  };

  // Listener over a pair of callables. The error callable may be empty.
  //
  class function_listener: public progress_listener
  {
  public:
    using progress_function = std::function<void (const progress_info&)>;
    using error_function = std::function<void (std::int64_t,
                                               std::exception_ptr)>;

    function_listener (progress_function p, error_function e)
      : progress_ (std::move (p)), error_ (std::move (e)) {}

    void
    on_progress (const progress_info& i) override
    {
      if (progress_)
        progress_ (i);
    }

    void
    on_error (std::int64_t id, std::exception_ptr e) override
    {
      if (error_)
        error_ (id, std::move (e));
    }

  private:
    progress_function progress_;
    error_function error_;
  };

  inline std::shared_ptr<progress_listener>
  make_progress_listener (function_listener::progress_function p,
                          function_listener::error_function e = nullptr)
  {
    return std::make_shared<function_listener> (std::move (p), std::move (e));
  }

  // Ordered list of listeners registered for one URL.
  //
  // The same list object may be shared by several URLs (see redirects) and by
  // the bodies currently being transferred. Appends and snapshots may happen
  // concurrently; delivery always iterates over a snapshot so that a listener
  // added in the meantime is not guaranteed to see an event already in
  // flight.
  //
  class listener_list
  {
  public:
    using listener_type = std::shared_ptr<progress_listener>;
    using snapshot_type = std::vector<listener_type>;

    void
    append (listener_type);

    snapshot_type
    snapshot () const;

    std::size_t
    size () const;

  private:
    mutable std::mutex mutex_;
    std::vector<listener_type> listeners_;
  };
}
