#include <stdio.h>
#include <atomic>
#include <chrono>
#include <boost/algorithm/string.hpp>
#include <boost/thread/mutex.hpp>
#include "logger.hpp"

namespace {

  boost::mutex log_mtx;
  FILE *log_stream = NULL;
  std::atomic<int> current_level(LOG_INFO);

  unsigned long long get_current_time() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  }

  const char* level_name(log_level level) {
    switch (level) {
    case LOG_TRACE: return "TRACE";
    case LOG_DEBUG: return "DEBUG";
    case LOG_INFO: return "INFO";
    case LOG_WARN: return "WARN";
    case LOG_ERROR: return "ERROR";
    }
    return "?";
  }

}

namespace logger {

  bool enabled(log_level level) {
    return level >= current_level.load();
  }

  void set_level(log_level level) {
    current_level = level;
  }

  log_level get_level() {
    return static_cast<log_level>(current_level.load());
  }

  bool set_output(const std::string &path) {
    FILE *f = fopen(path.c_str(), "a");
    if (f == NULL)
      return false;
    boost::mutex::scoped_lock lock(log_mtx);
    if (log_stream != NULL)
      fclose(log_stream);
    log_stream = f;
    return true;
  }

  bool parse_level(const std::string &name, log_level &level) {
    std::string lower = boost::algorithm::to_lower_copy(name);
    if (lower == "error")
      level = LOG_ERROR;
    else if (lower == "warn")
      level = LOG_WARN;
    else if (lower == "info")
      level = LOG_INFO;
    else if (lower == "debug")
      level = LOG_DEBUG;
    else if (lower == "trace")
      level = LOG_TRACE;
    else
      return false;
    return true;
  }

  void log(log_level level, const std::string &message) {
    if (!enabled(level))
      return;
    boost::mutex::scoped_lock lock(log_mtx);
    FILE *out = log_stream != NULL ? log_stream : stderr;
    fprintf(out, "%llu [ %s ] %s\n", get_current_time(), level_name(level),
            message.c_str());
    fflush(out);
  }

}
