#include <key_codec.hh>

using std::string;

namespace lrudir {

namespace {

const char ESCAPE_MARK    = '#';
const char SLASH_ESCAPE[] = "_%_";

// Fixed at compile time, no table to initialize.
inline bool is_safe (uint32_t c) {
 return (c >= 'a' and c <= 'z') or
        (c >= 'A' and c <= 'Z') or
        (c >= '0' and c <= '9') or
        c == '.' or c == '_' or c == '-';
}

inline bool is_continuation (unsigned char c) { return (c & 0xC0) == 0x80; }

// decode_utf8 {{{
// Decodes one code point at key[i]. Returns its length in bytes, or 0
// when key[i] does not start a well formed sequence (overlong forms,
// surrogates and values above U+10FFFF included).
size_t decode_utf8 (const string& key, size_t i, uint32_t& cp)
{
 const size_t left = key.size () - i;
 const unsigned char b0 = key[i];

 if (b0 < 0x80) {
  cp = b0;
  return 1;
 }

 if (b0 >= 0xC2 and b0 <= 0xDF) {
  if (left < 2) return 0;
  const unsigned char b1 = key[i + 1];
  if (not is_continuation (b1)) return 0;
  cp = ((b0 & 0x1F) << 6) | (b1 & 0x3F);
  return 2;
 }

 if (b0 >= 0xE0 and b0 <= 0xEF) {
  if (left < 3) return 0;
  const unsigned char b1 = key[i + 1], b2 = key[i + 2];
  const unsigned char lo = (b0 == 0xE0) ? 0xA0 : 0x80;
  const unsigned char hi = (b0 == 0xED) ? 0x9F : 0xBF;
  if (b1 < lo or b1 > hi or not is_continuation (b2)) return 0;
  cp = ((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
  return 3;
 }

 if (b0 >= 0xF0 and b0 <= 0xF4) {
  if (left < 4) return 0;
  const unsigned char b1 = key[i + 1], b2 = key[i + 2], b3 = key[i + 3];
  const unsigned char lo = (b0 == 0xF0) ? 0x90 : 0x80;
  const unsigned char hi = (b0 == 0xF4) ? 0x8F : 0xBF;
  if (b1 < lo or b1 > hi or not is_continuation (b2) or not is_continuation (b3))
   return 0;
  cp = ((b0 & 0x07) << 18) | ((b1 & 0x3F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
  return 4;
 }

 return 0;
}
// }}}

} /* anonymous namespace */

// append_varint_hex {{{
void append_varint_hex (string& out, int64_t v)
{
 static const char digits[] = "0123456789abcdef";

 uint64_t ux = static_cast<uint64_t> (v) << 1;
 if (v < 0) ux = ~ux;

 while (true) {
  unsigned char byte = ux & 0x7F;
  ux >>= 7;
  if (ux != 0) byte |= 0x80;

  out.push_back (digits[byte >> 4]);
  out.push_back (digits[byte & 0x0F]);

  if (ux == 0) break;
 }
}
// }}}
// encode_key {{{
// A byte that is not part of a valid UTF-8 sequence is escaped as
// -(byte + 1); code points are never negative so both can not meet.
// A leading '.' is escaped as well, names like ".", ".." and ".lru"
// belong to the filesystem or to the cache itself.
string encode_key (const string& key)
{
 string out;
 out.reserve (key.size ());

 size_t i = 0;
 while (i < key.size ()) {
  uint32_t cp = 0;
  size_t len = decode_utf8 (key, i, cp);

  if (len == 0) {
   const unsigned char b = key[i];
   out.push_back (ESCAPE_MARK);
   append_varint_hex (out, -static_cast<int64_t> (b) - 1);
   i++;
   continue;
  }

  if (is_safe (cp) and not (i == 0 and cp == '.')) {
   out.push_back (static_cast<char> (cp));

  } else if (cp == '/') {
   out.append (SLASH_ESCAPE);

  } else {
   out.push_back (ESCAPE_MARK);
   append_varint_hex (out, static_cast<int64_t> (cp));
  }
  i += len;
 }

 return out;
}
// }}}

} /* namespace lrudir */
