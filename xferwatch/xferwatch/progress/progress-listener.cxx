#include <xferwatch/progress/progress-listener.hxx>

#include <stdexcept>

using namespace std;

namespace xferwatch
{
  void listener_list::
  append (listener_type l)
  {
    if (l == nullptr)
      throw invalid_argument ("null progress listener");

    lock_guard<mutex> g (mutex_);
    listeners_.push_back (move (l));
  }

  listener_list::snapshot_type listener_list::
  snapshot () const
  {
    lock_guard<mutex> g (mutex_);
    return listeners_;
  }

  size_t listener_list::
  size () const
  {
    lock_guard<mutex> g (mutex_);
    return listeners_.size ();
  }
}
