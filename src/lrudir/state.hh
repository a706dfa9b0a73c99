// @brief
//  State marker of a cache directory, the ".lru" file. Its presence
//  tells Open that the directory was initialized by Create.
//
//  Stored as a JSON object: {"version": "1"}. An object without the
//  field ("{}") reads as version 1.
//
#ifndef __STATE_HH_
#define __STATE_HH_

#include <string>
#include <sys/types.h>

#define LRUDIR_STATE_FILE    ".lru"
#define LRUDIR_STATE_VERSION 1

namespace lrudir {

struct State {
 int version;

 State () : version (LRUDIR_STATE_VERSION) { }
};

// Throws NotACache when the marker is missing or unparseable.
State read_state  (const std::string& dir);
void  write_state (const std::string& dir, const State&, mode_t mode);

} /* namespace lrudir */

#endif
