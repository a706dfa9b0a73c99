// @brief
//  Doubly linked list of keys kept on disk, most recently used first.
//
//  Every key owns two pointer files, "<name>~next" (towards the tail)
//  and "<name>~prev" (towards the head), holding the literal bytes of
//  the neighbour key or nothing when there is none. The empty key is
//  the anchor: "~next" holds the head key, "~prev" the tail key.
//
//  Splices are sequences of independent file writes. A crash in the
//  middle leaves the list damaged and nothing here detects it.
//
#ifndef __RECENCY_LIST_HH_
#define __RECENCY_LIST_HH_

#include <string>
#include <vector>
#include <sys/types.h>

namespace lrudir {

class Recency_list {
 public:
  Recency_list (const std::string& dir, mode_t mode);

  std::string next_path (const std::string& key) const;
  std::string prev_path (const std::string& key) const;

  void init ();

  void attach_head (const std::string& key);
  void detach      (const std::string& key);
  void forget      (const std::string& key);

  std::string head   () const;
  std::string oldest () const;
  std::vector<std::string> traverse () const;

 protected:
  std::string next (const std::string& key) const;
  std::string prev (const std::string& key) const;
  void set_next (const std::string& key, const std::string& value);
  void set_prev (const std::string& key, const std::string& value);

  std::string dir;
  mode_t mode;
};

} /* namespace lrudir */

#endif
