#include <entry_store.hh>
#include <exception.hh>
#include <utils.hh>
#include <UnitTest++.h>
#include "tmpdir.hh"

using namespace lrudir;
using std::string;

struct fix_entry_store : public fix_tmpdir {
 Entry_store victim;

 fix_entry_store () : victim (dir, 0644) { }
};

SUITE (ENTRY_STORE_TEST) {
 // ----------------------------------------------------
 TEST_FIXTURE (fix_entry_store, write_read) {
  victim.write ("k", "Hello");
  CHECK_EQUAL ("Hello", victim.read ("k"));
  CHECK_EQUAL (join_path (dir, "k"), victim.path ("k"));
 }

 TEST_FIXTURE (fix_entry_store, overwrite) {
  victim.write ("k", "Hello, world");
  victim.write ("k", "Hola");
  CHECK_EQUAL ("Hola", victim.read ("k"));
 }

 TEST_FIXTURE (fix_entry_store, binary_value) {
  const string value ("\0\x01\xff\n", 4);
  victim.write ("bin", value);
  CHECK (victim.read ("bin") == value);
 }

 TEST_FIXTURE (fix_entry_store, large_value) {
  const string value (1 << 20, 'x');
  victim.write ("big", value);
  CHECK (victim.read ("big") == value);
 }

 // ----------------------------------------------------
 TEST_FIXTURE (fix_entry_store, missing) {
  CHECK_THROW (victim.read ("nope"), NotFound);
  CHECK_THROW (victim.remove ("nope"), NotFound);
 }

 TEST_FIXTURE (fix_entry_store, remove) {
  victim.write ("k", "v");
  victim.remove ("k");
  CHECK (not path_exists (victim.path ("k")));
 }
}
// -----------------------------------------------------
