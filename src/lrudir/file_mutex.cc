#include <file_mutex.hh>
#include <exception.hh>

#include <sys/file.h>
#include <fcntl.h>
#include <errno.h>
#include <unistd.h>

using std::string;

namespace lrudir {

// ctor/dtor {{{
// The lock file is created when missing and never written.
File_mutex::File_mutex (const string& p, mode_t mode) : path (p) {
 fd = ::open (path.c_str (), O_RDWR | O_CREAT | O_CLOEXEC, mode);
 if (fd == -1)
  throw LockFailure ("Cannot open lock file " + path, errno);
}

File_mutex::~File_mutex () {
 ::close (fd);   // Releases the lock if still held
}
// }}}
// lock {{{
void File_mutex::lock () {
 while (::flock (fd, LOCK_EX) == -1) {
  if (errno != EINTR)
   throw LockFailure ("Cannot acquire " + path, errno);
 }
}
// }}}
// try_lock {{{
bool File_mutex::try_lock () {
 while (::flock (fd, LOCK_EX | LOCK_NB) == -1) {
  if (errno == EWOULDBLOCK)
   return false;

  if (errno != EINTR)
   throw LockFailure ("Cannot acquire " + path, errno);
 }
 return true;
}
// }}}
// unlock {{{
void File_mutex::unlock () {
 while (::flock (fd, LOCK_UN) == -1) {
  if (errno != EINTR)
   throw LockFailure ("Cannot release " + path, errno);
 }
}
// }}}

} /* namespace lrudir */
