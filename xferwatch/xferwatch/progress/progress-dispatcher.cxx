#include <xferwatch/progress/progress-dispatcher.hxx>

#include <string>
#include <sstream>
#include <utility>
#include <stdexcept>

using namespace std;

namespace xferwatch
{
  progress_dispatcher::
  progress_dispatcher (executor_type e, shared_ptr<diagnostics> d)
    : strand_ (asio::make_strand (move (e))),
      diag_ (move (d))
  {
    if (diag_ == nullptr)
      throw invalid_argument ("progress dispatcher requires diagnostics");
  }

  void progress_dispatcher::
  post_progress (listeners_type ls, progress_info i)
  {
    if (ls.empty ())
      return;

    if (diag_->tracing (2))
    {
      ostringstream os;
      os << i;
      diag_->trace (os.str ());
    }

    asio::post (strand_,
                [ls = move (ls), i, d = diag_] ()
    {
      for (const auto& l: ls)
      {
        try
        {
          l->on_progress (i);
        }
        catch (const exception& e)
        {
          d->warning ("progress listener failed on update of transfer #" +
                      std::to_string (i.id ()) + ": " + e.what ());
        }
        catch (...)
        {
          d->warning ("progress listener failed on update of transfer #" +
                      std::to_string (i.id ()) + ": unknown exception");
        }
      }
    });
  }

  void progress_dispatcher::
  post_error (listeners_type ls, int64_t id, exception_ptr ep)
  {
    if (ls.empty ())
      return;

    asio::post (strand_,
                [ls = move (ls), id, ep = move (ep), d = diag_] ()
    {
      for (const auto& l: ls)
      {
        try
        {
          l->on_error (id, ep);
        }
        catch (const exception& e)
        {
          d->warning ("progress listener failed on error of transfer #" +
                      std::to_string (id) + ": " + e.what ());
        }
        catch (...)
        {
          d->warning ("progress listener failed on error of transfer #" +
                      std::to_string (id) + ": unknown exception");
        }
      }
    });
  }
}
