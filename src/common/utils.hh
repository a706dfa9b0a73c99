#ifndef __UTILS_HH_
#define __UTILS_HH_

#include <string>
#include <sys/types.h>

namespace lrudir {

// Thin wrappers around POSIX file calls. Every failure is reported
// through throw_errno (exception.hh): ENOENT becomes NotFound, the
// rest IOFailure.

std::string join_path      (const std::string& dir, const std::string& name);
std::string read_file      (const std::string& path);
void        write_file     (const std::string& path, const std::string& data, mode_t mode);
void        remove_file    (const std::string& path);
bool        path_exists    (const std::string& path);
bool        is_directory   (const std::string& path);
void        make_directory (const std::string& path, mode_t mode = 0755);
void        remove_all     (const std::string& path);

} /* namespace lrudir */

#endif
