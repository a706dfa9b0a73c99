#ifndef __ENTRY_STORE_HH_
#define __ENTRY_STORE_HH_

#include <string>
#include <sys/types.h>

namespace lrudir {

// One file per key holding the raw value bytes. No locking, callers
// serialize access.
class Entry_store {
 public:
  Entry_store (const std::string& dir, mode_t mode);

  std::string path  (const std::string& key) const;

  void        write  (const std::string& key, const std::string& value);
  std::string read   (const std::string& key) const;
  void        remove (const std::string& key);

 protected:
  std::string dir;
  mode_t mode;
};

} /* namespace lrudir */

#endif
