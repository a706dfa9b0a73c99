// @file
// @brief Simple Logger implementation using syslog
//
#include <logger.hh>

#include <stdarg.h>
#include <syslog.h>
#include <unordered_map>

using std::string;

namespace lrudir {

static std::unordered_map<string, int> syslog_facilities {
  {"LOG_LOCAL0" , LOG_LOCAL0},
  {"LOG_LOCAL1" , LOG_LOCAL1},
  {"LOG_LOCAL2" , LOG_LOCAL2},
  {"LOG_LOCAL3" , LOG_LOCAL3},
  {"LOG_LOCAL4" , LOG_LOCAL4},
  {"LOG_LOCAL5" , LOG_LOCAL5},
  {"LOG_LOCAL6" , LOG_LOCAL6},
  {"LOG_LOCAL7" , LOG_LOCAL7},
  {"LOG_DAEMON" , LOG_DAEMON},
  {"LOG_USER" , LOG_USER}
};

Logger* Logger::singleton = nullptr;

// connect {{{
// The first caller picks the title; later callers share it.
Logger* Logger::connect (string title, string type) {
  if (singleton == nullptr)
    singleton = new Logger(title, type);

  return singleton;
}
// }}}
// disconnect {{{
void Logger::disconnect (Logger* in) {
  if (singleton != nullptr && singleton == in) {
    delete singleton;
    singleton = nullptr;
  }
}
// }}}
// ctor/dtor {{{
Logger::Logger (string title_, string type) : title (title_) {
  auto it = syslog_facilities.find (type);
  int type_ = (it != syslog_facilities.end()) ? it->second : LOG_USER;

  // openlog keeps the pointer, so the member must outlive the connection
  openlog (title.c_str(), LOG_PID | LOG_CONS, type_);
}

Logger::~Logger () { closelog (); }
// }}}
// info/warn/error {{{
void Logger::info (const char* fmt, ...) {
  va_list ap;

  va_start(ap, fmt);
  log(LOG_INFO, fmt, ap);
  va_end(ap);
}

void Logger::warn (const char* fmt, ...) {
  va_list ap;

  va_start(ap, fmt);
  log(LOG_WARNING, fmt, ap);
  va_end(ap);
}

void Logger::error (const char* fmt, ...) {
  va_list ap;

  va_start(ap, fmt);
  log(LOG_ERR, fmt, ap);
  va_end(ap);
}

void Logger::log (int type, const char* fmt, va_list ap) {
  vsyslog (type, fmt, ap);
}
// }}}

} /* namespace lrudir */
