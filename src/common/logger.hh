// @file
// @brief Simple Logger using syslog. One connection per process.
//
// @code
// Logger* log = Logger::connect ("lrudir", "LOG_USER");
// log->info ("Opened cache at %s", path.c_str());
// @endcode
//
#ifndef __LOGGER_HH_
#define __LOGGER_HH_

#include <string>
#include <stdarg.h>

namespace lrudir {

class Logger {
 private:
  static Logger* singleton;
  std::string title;

  Logger (std::string, std::string);
  ~Logger ();

  void log (int, const char*, va_list);

 public:
  static Logger* connect (std::string title, std::string type);
  static void disconnect (Logger*);

  void info  (const char* fmt, ...) __attribute__((format (printf, 2, 3)));
  void warn  (const char* fmt, ...) __attribute__((format (printf, 2, 3)));
  void error (const char* fmt, ...) __attribute__((format (printf, 2, 3)));
};

} /* namespace lrudir */

#endif
