// @brief
//  LRU cache kept in a directory. Every entry is a file and the recency
//  order is a linked list of pointer files (see recency_list.hh), so the
//  key set is never loaded in memory.
//
//  Not thread safe and not process safe by itself. The cross process
//  mutex returned by mutex() is never taken by the operations below,
//  callers hold it around the sequences they need isolated.
//
// @usage:
//  auto cache = lrudir::Cache::open_or_create ("/tmp/thumbs");
//  cache->put ("a.png", bytes);
//  std::string v = cache->get ("a.png");
//  while (too_big ()) cache->remove_oldest ();
//
#ifndef __CACHE_HH_
#define __CACHE_HH_

#include <entry_store.hh>
#include <recency_list.hh>
#include <file_mutex.hh>
#include <settings.hh>
#include <logger.hh>

#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#define LRUDIR_LOCK_FILE ".lrulock"

namespace lrudir {

class Cache {
 public:
  // Initializes a cache in an existing directory. On failure the whole
  // directory is removed.
  static std::unique_ptr<Cache> create (const std::string& dir);
  static std::unique_ptr<Cache> create (const std::string& dir, const Settings&);

  // Throws NotACache when dir has no valid state marker.
  static std::unique_ptr<Cache> open (const std::string& dir);
  static std::unique_ptr<Cache> open (const std::string& dir, const Settings&);

  static std::unique_ptr<Cache> open_or_create (const std::string& dir);
  static std::unique_ptr<Cache> open_or_create (const std::string& dir, const Settings&);

  std::string get (const std::string& key);
  void put (const std::string& key, const std::string& value);
  void remove (const std::string& key);

  std::vector<std::string> keys () const;
  std::string oldest () const;
  void remove_oldest ();

  // Path of the entry file for key, whether it exists or not.
  std::string path (const std::string& key) const;

  const std::string& get_dir () const { return dir; }
  File_mutex& mutex () { return *lock; }

 protected:
  Cache (const std::string& dir, const Settings&);

  std::string dir;
  mode_t mode;
  Entry_store entries;
  Recency_list list;
  std::unique_ptr<File_mutex> lock;
  Logger* log;
};

} /* namespace lrudir */

#endif
