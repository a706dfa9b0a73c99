#include <cache.hh>
#include <state.hh>
#include <exception.hh>
#include <utils.hh>

#include <errno.h>
#include <stdlib.h>

using std::string;
using std::vector;
using std::unique_ptr;

namespace lrudir {

namespace {

mode_t parse_mode (const Settings& setted) {
 string str = setted.get<string> ("cache.file_mode", "0644");
 char* end  = nullptr;
 long mode  = strtol (str.c_str (), &end, 8);

 if (str.empty () or *end != '\0' or mode < 0 or mode > 07777)
  throw InvalidArgument ("cache.file_mode is not an octal mode: " + str);

 return static_cast<mode_t> (mode);
}

void check_key (const string& key, const char* op) {
 if (key.empty ())
  throw InvalidArgument (string ("Cannot ") + op + " the empty key");
}

} /* anonymous namespace */

// Constructor {{{
// -----------------------------------------------
Cache::Cache (const string& d, const Settings& setted) :
 dir     (d),
 mode    (parse_mode (setted)),
 entries (dir, mode),
 list    (dir, mode),
 log     (Logger::connect (setted.get<string> ("log.name", "lrudir"),
                           setted.get<string> ("log.type", "LOG_USER")))
{ }
// }}}
// create {{{
// -----------------------------------------------
unique_ptr<Cache> Cache::create (const string& dir) {
 return create (dir, Settings().load());
}

unique_ptr<Cache> Cache::create (const string& dir, const Settings& setted) {
 if (not is_directory (dir))
  throw IOFailure (dir + " is not a directory", ENOTDIR);

 unique_ptr<Cache> cache (new Cache (dir, setted));

 try {
  cache->lock.reset (new File_mutex (join_path (dir, LRUDIR_LOCK_FILE), cache->mode));
  cache->list.init ();
  write_state (dir, State (), cache->mode);

 } catch (Exception& e) {
  cache->log->warn ("Cannot create cache at %s, removing it: %s", dir.c_str (), e.what ());
  cache->lock.reset ();

  try {
   remove_all (dir);
  } catch (Exception& cleanup) {
   cache->log->error ("Cannot remove %s: %s", dir.c_str (), cleanup.what ());
  }
  throw;
 }

 cache->log->info ("Created cache at %s", dir.c_str ());
 return cache;
}
// }}}
// open {{{
// -----------------------------------------------
unique_ptr<Cache> Cache::open (const string& dir) {
 return open (dir, Settings().load());
}

unique_ptr<Cache> Cache::open (const string& dir, const Settings& setted) {
 unique_ptr<Cache> cache (new Cache (dir, setted));
 cache->lock.reset (new File_mutex (join_path (dir, LRUDIR_LOCK_FILE), cache->mode));

 try {
  read_state (dir);

 } catch (NotACache& e) {
  cache->log->error ("Refusing to open %s: %s", dir.c_str (), e.what ());
  throw;
 }

 cache->log->info ("Opened cache at %s", dir.c_str ());
 return cache;
}
// }}}
// open_or_create {{{
// A missing directory is created here, create() expects one.
// -----------------------------------------------
unique_ptr<Cache> Cache::open_or_create (const string& dir) {
 return open_or_create (dir, Settings().load());
}

unique_ptr<Cache> Cache::open_or_create (const string& dir, const Settings& setted) {
 if (path_exists (dir))
  return open (dir, setted);

 make_directory (dir);
 return create (dir, setted);
}
// }}}
// get {{{
// A read is also a use: the key moves to the head.
// -----------------------------------------------
string Cache::get (const string& key) {
 check_key (key, "get");

 string value = entries.read (key);
 list.detach (key);
 list.attach_head (key);

 return value;
}
// }}}
// put {{{
// -----------------------------------------------
void Cache::put (const string& key, const string& value) {
 check_key (key, "put");

 entries.write (key, value);

 try {
  list.detach (key);
 } catch (NotFound&) {
  // New key, nothing to unlink
 }

 list.attach_head (key);
}
// }}}
// remove {{{
// Nothing is rolled back: a failure after detach leaves some files behind.
// -----------------------------------------------
void Cache::remove (const string& key) {
 check_key (key, "delete");

 list.detach (key);
 entries.remove (key);
 list.forget (key);
}
// }}}
// keys/oldest/remove_oldest {{{
// -----------------------------------------------
vector<string> Cache::keys () const {
 return list.traverse ();
}

string Cache::oldest () const {
 string key = list.oldest ();
 if (key.empty ())
  throw NotFound ("Cache " + dir + " is empty");

 return key;
}

void Cache::remove_oldest () {
 remove (oldest ());
}

string Cache::path (const string& key) const {
 return entries.path (key);
}
// }}}

} /* namespace lrudir */
