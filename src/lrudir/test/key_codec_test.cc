#include <key_codec.hh>
#include <UnitTest++.h>
#include <set>

using lrudir::encode_key;
using std::string;

SUITE (KEY_CODEC_TEST) {
 // ----------------------------------------------------
 TEST (pass_through) {
  CHECK_EQUAL ("key1", encode_key ("key1"));
  CHECK_EQUAL ("Hello_World-2.txt", encode_key ("Hello_World-2.txt"));
 }

 TEST (empty_key_is_anchor) {
  CHECK_EQUAL ("", encode_key (""));
 }

 TEST (slash) {
  CHECK_EQUAL ("a_%_b", encode_key ("a/b"));
  CHECK_EQUAL ("_%__%_", encode_key ("//"));
 }

 // ----------------------------------------------------
 TEST (escaped_code_points) {
  CHECK_EQUAL ("a#40b", encode_key ("a b"));         //! ' ' = 32 -> 64
  CHECK_EQUAL ("#fc01", encode_key ("~"));           //! 126 -> 252
  CHECK_EQUAL ("caf#d203", encode_key ("caf\xc3\xa9"));
  CHECK_EQUAL ("#00", encode_key (string ("\0", 1)));
 }

 TEST (invalid_utf8_bytes) {
  CHECK_EQUAL ("#ff03", encode_key ("\xff"));
  CHECK_EQUAL ("#8102", encode_key ("\x80"));
  CHECK_EQUAL ("x#8102#d203", encode_key ("x\x80\xc3\xa9"));
 }

 TEST (leading_dot) {
  CHECK_EQUAL ("#5c", encode_key ("."));
  CHECK_EQUAL ("#5c.", encode_key (".."));
  CHECK_EQUAL ("#5clru", encode_key (".lru"));
  CHECK_EQUAL ("a.b", encode_key ("a.b"));
 }

 // ----------------------------------------------------
 TEST (no_tilde_in_names) {
  CHECK (encode_key ("x~next").find ('~') == string::npos);
 }

 TEST (distinct_keys_distinct_names) {
  const char* keys[] = {
   "a/b", "a_%_b", "a#2f", "#", "\xc3\xa9", "\xe9", "\xc3", "\xa9",
   "\xc3\xa9\xc3", ".", "#5c", "~", "~next", "", "a", "A"
  };
  std::set<string> names;
  const size_t n = sizeof keys / sizeof keys[0];
  for (size_t i = 0; i < n; i++)
   names.insert (encode_key (keys[i]));

  CHECK_EQUAL (n, names.size ());
 }

 TEST (long_key) {
  string key (100000, 'z');
  CHECK_EQUAL (key, encode_key (key));
 }
}
// -----------------------------------------------------
