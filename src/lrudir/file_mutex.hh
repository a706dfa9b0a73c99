// @brief
//  Advisory whole-file lock shared between processes. It satisfies
//  Lockable, so the usual guards apply:
//
// @usage:
//  {
//   std::lock_guard<lrudir::File_mutex> guard (cache->mutex ());
//   cache->put ("k", "v");
//   cache->remove_oldest ();
//  }
//
//  The lock is taken with flock(2) on the handle opened by this object,
//  two File_mutex on the same path exclude each other even inside one
//  process.
//
#ifndef __FILE_MUTEX_HH_
#define __FILE_MUTEX_HH_

#include <string>
#include <sys/types.h>

namespace lrudir {

class File_mutex {
 public:
  explicit File_mutex (const std::string& path, mode_t mode = 0644);
  ~File_mutex ();

  File_mutex (const File_mutex&) = delete;
  File_mutex& operator= (const File_mutex&) = delete;

  void lock ();
  bool try_lock ();
  void unlock ();

  const std::string& get_path () const { return path; }

 protected:
  std::string path;
  int fd;
};

} /* namespace lrudir */

#endif
