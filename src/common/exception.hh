#ifndef __EXCEPTION_HH_
#define __EXCEPTION_HH_

#include <stdexcept>
#include <string>
#include <stdio.h>
#include <string.h>

//UNIX dependent error libraries
#include <errno.h>

namespace lrudir {

using std::string;

// Exception {{{
// Base of every error thrown by lrudir. Built either from a plain
// message or from a failing system call, in which case errno is
// appended to the message.
class Exception: public std::runtime_error {
 public:
  explicit Exception (const string& in) : std::runtime_error (in), err (0) { }

  Exception (const string& in, int e) :
    std::runtime_error (extra_information (in, e)), err (e) { }

  int error_number () const { return err; }

 protected:
  int err;

  static string extra_information (const string& in, int e) {
   char tmp [256];
   snprintf (tmp, 256, " [ERRNO: %i] [STR: %s]", e, strerror (e));
   return "[REASON: " + in + "]" + tmp;
  }
};
// }}}
// Taxonomy {{{
class InvalidArgument: public Exception {
 public:
  explicit InvalidArgument (const string& in) : Exception (in) { }
};

class NotFound: public Exception {
 public:
  explicit NotFound (const string& in) : Exception (in) { }
  NotFound (const string& in, int e) : Exception (in, e) { }
};

class IOFailure: public Exception {
 public:
  explicit IOFailure (const string& in) : Exception (in) { }
  IOFailure (const string& in, int e) : Exception (in, e) { }
};

class NotACache: public Exception {
 public:
  explicit NotACache (const string& in) : Exception (in) { }
};

class LockFailure: public Exception {
 public:
  explicit LockFailure (const string& in) : Exception (in) { }
  LockFailure (const string& in, int e) : Exception (in, e) { }
};
// }}}
// throw_errno {{{
// Maps errno of a failed filesystem call onto the taxonomy.
[[noreturn]] inline void throw_errno (const string& what, int e) {
 if (e == ENOENT || e == ENOTDIR)
  throw NotFound (what, e);

 throw IOFailure (what, e);
}
// }}}

} /* namespace lrudir */

#endif
