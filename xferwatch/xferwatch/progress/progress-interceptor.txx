#include <string>
#include <utility>
#include <stdexcept>

namespace xferwatch
{
  template <typename T>
  basic_progress_interceptor<T>::
  basic_progress_interceptor (std::shared_ptr<registry_type> r,
                              std::shared_ptr<progress_dispatcher> p,
                              std::shared_ptr<diagnostics> d,
                              std::chrono::milliseconds i)
    : registry_ (std::move (r)),
      dispatcher_ (std::move (p)),
      diag_ (std::move (d)),
      interval_ (0)
  {
    if (registry_ == nullptr || dispatcher_ == nullptr || diag_ == nullptr)
      throw std::invalid_argument (
        "progress interceptor requires registry, dispatcher, and diagnostics");

    refresh_interval (i);
  }

  template <typename T>
  void basic_progress_interceptor<T>::
  refresh_interval (std::chrono::milliseconds i)
  {
    if (i.count () < 0)
      throw std::invalid_argument ("negative refresh interval");

    interval_.store (i.count (), std::memory_order_relaxed);
  }

  template <typename T>
  typename basic_progress_interceptor<T>::request_type
  basic_progress_interceptor<T>::
  intercept_request (request_type r)
  {
    if (!r.has_body ())
      return r;

    auto ls (registry_->lookup_request (r.url));
    if (ls == nullptr)
      return r;

    auto b (std::make_shared<body_type> (std::move (r.body),
                                         std::move (ls),
                                         dispatcher_,
                                         transfer_direction::upload,
                                         refresh_interval ()));
    if (diag_->tracing ())
      diag_->trace ("tracking upload #" + std::to_string (b->id ()) +
                    " to '" + r.url + "'");

    r.body = std::move (b);
    return r;
  }

  template <typename T>
  typename basic_progress_interceptor<T>::response_type
  basic_progress_interceptor<T>::
  intercept_response (response_type r)
  {
    // A redirect response has nothing worth tracking in its body. All we do
    // is make sure the listeners follow the client to the new location.
    //
    if (registry_->resolve_redirect (r))
      return r;

    if (!r.has_body ())
      return r;

    auto ls (registry_->lookup_response (r.url));
    if (ls == nullptr)
      return r;

    auto b (std::make_shared<body_type> (std::move (r.body),
                                         std::move (ls),
                                         dispatcher_,
                                         transfer_direction::download,
                                         refresh_interval ()));
    if (diag_->tracing ())
      diag_->trace ("tracking download #" + std::to_string (b->id ()) +
                    " from '" + r.url + "'");

    r.body = std::move (b);
    return r;
  }
}
