#ifndef __TMPDIR_HH_
#define __TMPDIR_HH_

#include <utils.hh>
#include <string>
#include <stdlib.h>
#include <stdexcept>

// Private scratch directory, removed with everything inside on
// destruction.
struct fix_tmpdir {
 std::string dir;

 fix_tmpdir () {
  char tmpl[] = "/tmp/lrudir_test_XXXXXX";
  if (mkdtemp (tmpl) == nullptr)
   throw std::runtime_error ("mkdtemp failed");
  dir = tmpl;
 }
 ~fix_tmpdir () {
  try {
   lrudir::remove_all (dir);
  } catch (std::exception&) { }
 }
};

#endif
