#include <xferwatch/progress/progress-info.hxx>

#include <atomic>

using namespace std;

namespace xferwatch
{
  ostream&
  operator<< (ostream& o, transfer_direction d)
  {
    return o << (d == transfer_direction::upload ? "upload" : "download");
  }

  int progress_info::
  percent () const noexcept
  {
    if (content_length_ <= 0 || current_bytes_ == 0)
      return 0;

    uint64_t p (current_bytes_ * 100 / static_cast<uint64_t> (content_length_));
    return static_cast<int> (p > 100 ? 100 : p);
  }

  uint64_t progress_info::
  speed () const noexcept
  {
    if (interval_ms_ <= 0 || each_bytes_ <= 0)
      return 0;

    return static_cast<uint64_t> (each_bytes_) * 1000 /
           static_cast<uint64_t> (interval_ms_);
  }

  ostream&
  operator<< (ostream& o, const progress_info& i)
  {
    o << '#' << i.id () << ' ' << i.current_bytes ();

    if (i.known_length ())
      o << '/' << i.content_length () << " (" << i.percent () << "%)";
    else
      o << "/?";

    if (i.finished ())
      o << " finished";

    return o;
  }

  int64_t
  next_progress_id () noexcept
  {
    static atomic<int64_t> id (0);
    return id.fetch_add (1, memory_order_relaxed) + 1;
  }
}
