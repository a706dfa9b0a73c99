// @brief
//  Maps arbitrary byte keys to names that are valid filenames on every
//  operating system, keeping them as readable as possible.
//
//   - ASCII letters, digits and "._-" are copied as they are
//   - '/' becomes "_%_"
//   - anything else becomes '#' followed by the hex of the zig-zag
//     varint of its code point
//
//  The mapping is injective. It is never reversed: keys are read back
//  from the contents of the pointer files, not from filenames.
//
// @usage:
//  encode_key ("a/b")   => "a_%_b"
//  encode_key ("caf\xc3\xa9") => "caf#d203"
//
#ifndef __KEY_CODEC_HH_
#define __KEY_CODEC_HH_

#include <string>
#include <stdint.h>

namespace lrudir {

std::string encode_key (const std::string& key);

// Appends the zig-zag varint of v as lowercase hex. Exposed for tests.
void append_varint_hex (std::string& out, int64_t v);

} /* namespace lrudir */

#endif
