#include <recency_list.hh>
#include <key_codec.hh>
#include <exception.hh>
#include <utils.hh>

using std::string;
using std::vector;

namespace lrudir {

namespace {
const char NEXT_SUFFIX[] = "~next";
const char PREV_SUFFIX[] = "~prev";
const string ANCHOR;
}

// Constructor&paths {{{
// -----------------------------------------------
Recency_list::Recency_list (const string& d, mode_t m) : dir (d), mode (m) { }

string Recency_list::next_path (const string& key) const {
 return join_path (dir, encode_key (key) + NEXT_SUFFIX);
}

string Recency_list::prev_path (const string& key) const {
 return join_path (dir, encode_key (key) + PREV_SUFFIX);
}
// -----------------------------------------------
string Recency_list::next (const string& key) const { return read_file (next_path (key)); }
string Recency_list::prev (const string& key) const { return read_file (prev_path (key)); }

void Recency_list::set_next (const string& key, const string& value) {
 write_file (next_path (key), value, mode);
}

void Recency_list::set_prev (const string& key, const string& value) {
 write_file (prev_path (key), value, mode);
}
// }}}
// init {{{
// Empty list: both anchors hold nothing.
void Recency_list::init () {
 set_next (ANCHOR, ANCHOR);
 set_prev (ANCHOR, ANCHOR);
}
// }}}
// attach_head {{{
// When the list is empty the old head is the anchor itself, so the
// last write lands on the tail anchor and key becomes head and tail.
void Recency_list::attach_head (const string& key) {
 string old_head = next (ANCHOR);

 set_next (ANCHOR, key);
 set_prev (key, ANCHOR);
 set_next (key, old_head);
 set_prev (old_head, key);
}
// }}}
// detach {{{
// Links the neighbours of key together. The pointer files of key are
// left in place. Throws NotFound when key is not in the list.
void Recency_list::detach (const string& key) {
 if (key.empty ())
  throw InvalidArgument ("Cannot detach the anchor");

 string n = next (key);
 string p = prev (key);

 set_prev (n, p);
 set_next (p, n);
}
// }}}
// forget {{{
// Removes the pointer files of an already detached key.
void Recency_list::forget (const string& key) {
 remove_file (next_path (key));
 remove_file (prev_path (key));
}
// }}}
// head/oldest/traverse {{{
string Recency_list::head ()   const { return next (ANCHOR); }
string Recency_list::oldest () const { return prev (ANCHOR); }

// O(N), most recently used first.
vector<string> Recency_list::traverse () const {
 vector<string> keys;

 for (string key = next (ANCHOR); not key.empty (); key = next (key))
  keys.push_back (key);

 return keys;
}
// }}}

} /* namespace lrudir */
