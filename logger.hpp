// Levelled logging for rqbitfs. Messages go to stderr unless a log file is
// configured.

#ifndef logger_h
#define logger_h

#include <string>

enum log_level {
  LOG_TRACE,
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARN,
  LOG_ERROR
};

namespace logger {

  void log(log_level level, const std::string &message);

  bool enabled(log_level level);

  void set_level(log_level level);

  log_level get_level();

  /* Returns false if the file could not be opened; output stays unchanged */
  bool set_output(const std::string &path);

  /* Accepts error, warn, info, debug, trace (case insensitive) */
  bool parse_level(const std::string &name, log_level &level);

}

#endif //logger_h
