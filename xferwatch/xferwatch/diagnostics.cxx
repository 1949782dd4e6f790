#include <xferwatch/diagnostics.hxx>

using namespace std;

namespace xferwatch
{
  diagnostics::
  diagnostics (ostream& os, uint16_t v)
    : os_ (os), verbosity_ (v)
  {
  }

  void diagnostics::
  trace (const string& m)
  {
    write ("trace", m);
  }

  void diagnostics::
  warning (const string& m)
  {
    write ("warning", m);
  }

  void diagnostics::
  write (const char* s, const string& m)
  {
    lock_guard<mutex> g (mutex_);
    os_ << s << ": " << m << '\n';
    os_.flush ();
  }
}
