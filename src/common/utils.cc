#include <utils.hh>
#include <exception.hh>

#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <ftw.h>
#include <errno.h>
#include <stdio.h>
#include <unistd.h>

using std::string;

namespace lrudir {

// join_path {{{
string join_path (const string& dir, const string& name)
{
 if (dir.empty () or dir[dir.size () - 1] == '/')
  return dir + name;

 return dir + "/" + name;
}
// }}}
// read_file {{{
string read_file (const string& path)
{
 int fd = ::open (path.c_str (), O_RDONLY | O_CLOEXEC);
 if (fd == -1)
  throw_errno ("Cannot open " + path, errno);

 string out;
 char buf [1 << 12];

 while (true) {
  ssize_t n = ::read (fd, buf, sizeof buf);
  if (n == -1) {
   if (errno == EINTR) continue;

   int e = errno;
   ::close (fd);
   throw_errno ("Cannot read " + path, e);
  }
  if (n == 0) break;

  out.append (buf, static_cast<size_t> (n));
 }

 ::close (fd);
 return out;
}
// }}}
// write_file {{{
// Truncates or creates the file, then writes the whole buffer.
void write_file (const string& path, const string& data, mode_t mode)
{
 int fd = ::open (path.c_str (), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
 if (fd == -1)
  throw_errno ("Cannot open " + path + " for writing", errno);

 const char* p = data.data ();
 size_t left = data.size ();

 while (left > 0) {
  ssize_t n = ::write (fd, p, left);
  if (n == -1) {
   if (errno == EINTR) continue;

   int e = errno;
   ::close (fd);
   throw_errno ("Cannot write " + path, e);
  }
  p    += n;
  left -= static_cast<size_t> (n);
 }

 if (::close (fd) == -1)
  throw_errno ("Cannot close " + path, errno);
}
// }}}
// remove_file {{{
void remove_file (const string& path)
{
 if (::unlink (path.c_str ()) == -1)
  throw_errno ("Cannot remove " + path, errno);
}
// }}}
// path_exists / is_directory {{{
bool path_exists (const string& path)
{
 struct stat st;
 if (::stat (path.c_str (), &st) == 0)
  return true;

 if (errno == ENOENT or errno == ENOTDIR)
  return false;

 throw IOFailure ("Cannot stat " + path, errno);
}

bool is_directory (const string& path)
{
 struct stat st;
 if (::stat (path.c_str (), &st) == -1)
  throw_errno ("Cannot stat " + path, errno);

 return S_ISDIR (st.st_mode);
}
// }}}
// make_directory {{{
void make_directory (const string& path, mode_t mode)
{
 if (::mkdir (path.c_str (), mode) == -1)
  throw_errno ("Cannot create directory " + path, errno);
}
// }}}
// remove_all {{{
// Depth first, so directories are already empty when we reach them.
static int remove_entry (const char* fpath, const struct stat*, int, struct FTW*)
{
 return ::remove (fpath) == -1 ? errno : 0;
}

void remove_all (const string& path)
{
 struct stat st;
 if (::lstat (path.c_str (), &st) == -1) {
  if (errno == ENOENT) return;
  throw_errno ("Cannot stat " + path, errno);
 }

 int ret = ::nftw (path.c_str (), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
 if (ret == -1)
  throw_errno ("Cannot walk " + path, errno);
 if (ret != 0)
  throw_errno ("Cannot remove " + path, ret);
}
// }}}

} /* namespace lrudir */
