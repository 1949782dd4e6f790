#pragma once

#include <cstdint>
#include <ostream>

namespace xferwatch
{
  // Direction of a tracked transfer.
  //
  enum class transfer_direction
  {
    upload,   // Request body.
    download  // Response body.
  };

  std::ostream&
  operator<< (std::ostream&, transfer_direction);

  // Snapshot of one body's transfer state.
  //
  // A new snapshot is made for every emitted update and is never modified
  // afterwards, so listeners may keep it around.
  //
  class progress_info
  {
  public:
    progress_info (std::int64_t id,
                   std::int64_t content_length,
                   std::uint64_t current_bytes,
                   std::int64_t each_bytes,
                   std::int64_t interval_ms,
                   bool finished) noexcept
      : id_ (id),
        content_length_ (content_length),
        current_bytes_ (current_bytes),
        each_bytes_ (each_bytes),
        interval_ms_ (interval_ms),
        finished_ (finished) {}

    // Identifies the transfer. Unique per wrapped body within the process and
    // never -1 (which on_error() uses for errors not tied to a transfer).
    //
    std::int64_t
    id () const noexcept {return id_;}

    // Declared total or -1 if unknown.
    //
    std::int64_t
    content_length () const noexcept {return content_length_;}

    bool
    known_length () const noexcept {return content_length_ >= 0;}

    // Bytes transferred so far.
    //
    std::uint64_t
    current_bytes () const noexcept {return current_bytes_;}

    // Bytes transferred since the previous update or -1 for the end of data
    // update that carries no new bytes.
    //
    std::int64_t
    each_bytes () const noexcept {return each_bytes_;}

    // Milliseconds since the previous update (or since the transfer
    // started, for the first one).
    //
    std::int64_t
    interval_ms () const noexcept {return interval_ms_;}

    bool
    finished () const noexcept {return finished_;}

    // Completion percentage (0-100). 0 if the length is unknown or zero.
    //
    int
    percent () const noexcept;

    // Bytes per second over the last interval. 0 if not computable.
    //
    std::uint64_t
    speed () const noexcept;

  private:
    std::int64_t  id_;
    std::int64_t  content_length_;
    std::uint64_t current_bytes_;
    std::int64_t  each_bytes_;
    std::int64_t  interval_ms_;
    bool          finished_;
  };

  std::ostream&
  operator<< (std::ostream&, const progress_info&);

  // Allocate a new transfer id. Thread-safe.
  //
  std::int64_t
  next_progress_id () noexcept;
}
