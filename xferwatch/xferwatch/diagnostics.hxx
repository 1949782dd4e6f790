#pragma once

#include <mutex>
#include <string>
#include <cstdint>
#include <ostream>

namespace xferwatch
{
  // Diagnostics sink.
  //
  // Writes one "<severity>: <message>" line at a time to the underlying
  // stream. Lines from concurrent writers are not interleaved.
  //
  // Verbosity 0 only prints warnings, 1 adds traces of wrapping and redirect
  // decisions, 2 adds per-update traces.
  //
  class diagnostics
  {
  public:
    explicit
    diagnostics (std::ostream&, std::uint16_t verbosity = 0);

    diagnostics (const diagnostics&) = delete;
    diagnostics& operator= (const diagnostics&) = delete;

    bool
    tracing (std::uint16_t level = 1) const noexcept
    {
      return verbosity_ >= level;
    }

    void
    trace (const std::string&);

    void
    warning (const std::string&);

    std::uint16_t
    verbosity () const noexcept
    {
      return verbosity_;
    }

  private:
    void
    write (const char* severity, const std::string&);

  private:
    std::ostream& os_;
    std::uint16_t verbosity_;
    std::mutex mutex_;
  };
}
