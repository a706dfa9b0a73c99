#include <entry_store.hh>
#include <key_codec.hh>
#include <utils.hh>

using std::string;

namespace lrudir {

Entry_store::Entry_store (const string& d, mode_t m) : dir (d), mode (m) { }

string Entry_store::path (const string& key) const {
 return join_path (dir, encode_key (key));
}

void Entry_store::write (const string& key, const string& value) {
 write_file (path (key), value, mode);
}

string Entry_store::read (const string& key) const {
 return read_file (path (key));
}

void Entry_store::remove (const string& key) {
 remove_file (path (key));
}

} /* namespace lrudir */
