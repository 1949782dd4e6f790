#include <stdexcept>

namespace xferwatch
{
  // Validate the executor before anything gets a chance to post to it: an
  // empty one would otherwise only fail on the first update, on some I/O
  // thread, far away from the mistake.
  //
  inline progress_dispatcher::executor_type
  checked_executor (progress_dispatcher::executor_type e)
  {
    if (!e)
      throw std::invalid_argument ("progress manager requires a delivery "
                                   "executor");
    return e;
  }

  inline std::ostream&
  checked_stream (std::ostream* s)
  {
    if (s == nullptr)
      throw std::invalid_argument ("progress manager requires a diagnostics "
                                   "stream");
    return *s;
  }

  template <typename T>
  basic_progress_manager<T>::
  basic_progress_manager (executor_type e, const progress_manager_options& o)
    : diag_ (std::make_shared<diagnostics> (checked_stream (o.diagnostics),
                                            o.verbosity)),
      dispatcher_ (std::make_shared<progress_dispatcher> (
                     checked_executor (std::move (e)), diag_)),
      registry_ (std::make_shared<registry_type> (dispatcher_, diag_)),
      interceptor_ (std::make_shared<interceptor_type> (
                      registry_,
                      dispatcher_,
                      diag_,
                      o.refresh_interval
                      ? *o.refresh_interval
                      : std::chrono::milliseconds (
                          traits_type::refresh_interval_ms)))
  {
  }
}
