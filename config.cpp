#include <stdlib.h>
#include <fstream>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <json/json.h>
#include "config.hpp"
#include "http_util.hpp"
#include "logger.hpp"
#include "rqbitfs_error.hpp"

namespace bfs = boost::filesystem;

namespace {

  bool read_string(const Json::Value &section, const char *key,
                   std::string &out) {
    if (!section.isMember(key))
      return true;
    const Json::Value &v = section[key];
    if (v.isNull()) {
      out.clear();
      return true;
    }
    if (!v.isString())
      return false;
    out = v.asString();
    return true;
  }

  template <typename T>
  bool read_uint(const Json::Value &section, const char *key, T &out) {
    if (!section.isMember(key))
      return true;
    const Json::Value &v = section[key];
    if (!v.isUInt64())
      return false;
    out = static_cast<T>(v.asUInt64());
    return true;
  }

  bool read_int(const Json::Value &section, const char *key, int &out) {
    if (!section.isMember(key))
      return true;
    const Json::Value &v = section[key];
    if (!v.isInt())
      return false;
    out = v.asInt();
    return true;
  }

  bool read_bool(const Json::Value &section, const char *key, bool &out) {
    if (!section.isMember(key))
      return true;
    const Json::Value &v = section[key];
    if (!v.isBool())
      return false;
    out = v.asBool();
    return true;
  }

  const char* get_env(const char *name) {
    const char *val = getenv(name);
    return val;
  }

  template <typename T>
  bool parse_env_number(const char *name, T &out) {
    const char *val = get_env(name);
    if (val == NULL)
      return true;
    std::string s(val);
    if (s.empty() || !boost::algorithm::all(s, boost::algorithm::is_digit()))
      return false;
    try {
      out = boost::lexical_cast<T>(s);
    } catch (const boost::bad_lexical_cast &) {
      return false;
    }
    return true;
  }

}

rqbitfs_config::rqbitfs_config() {
  api.url = "http://127.0.0.1:3030";

  cache.metadata_ttl = 60;
  cache.max_entries = 1000;

  mount.mount_point = "/mnt/torrents";
  mount.allow_other = false;

  performance.read_timeout = 30;
  performance.worker_threads = 4;
  performance.request_queue_capacity = 1000;
  performance.stream_seek_threshold = 4 * 1024 * 1024;
  performance.stream_idle_timeout = 3600;
  performance.max_streams = 50;
  performance.max_open_files = 0;
  performance.check_pieces_before_read = false;

  logging.level = "info";
}

boost::system::error_code rqbitfs_config::load_file(const std::string &path) {
  std::ifstream in(path.c_str());
  if (!in)
    return rqbitfs_errors::io_error;

  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
    logger::log(LOG_ERROR, "Cannot parse config " + path + ": " + errs);
    return rqbitfs_errors::parse_error;
  }

  bool ok = true;
  const Json::Value &a = root["api"];
  if (a.isObject()) {
    ok = ok && read_string(a, "url", api.url);
    ok = ok && read_string(a, "username", api.username);
    ok = ok && read_string(a, "password", api.password);
  }
  const Json::Value &c = root["cache"];
  if (c.isObject()) {
    ok = ok && read_uint(c, "metadata_ttl", cache.metadata_ttl);
    ok = ok && read_uint(c, "max_entries", cache.max_entries);
  }
  const Json::Value &m = root["mount"];
  if (m.isObject()) {
    ok = ok && read_string(m, "mount_point", mount.mount_point);
    ok = ok && read_bool(m, "allow_other", mount.allow_other);
  }
  const Json::Value &p = root["performance"];
  if (p.isObject()) {
    ok = ok && read_uint(p, "read_timeout", performance.read_timeout);
    ok = ok && read_int(p, "worker_threads", performance.worker_threads);
    ok = ok && read_uint(p, "request_queue_capacity",
                         performance.request_queue_capacity);
    ok = ok && read_uint(p, "stream_seek_threshold",
                         performance.stream_seek_threshold);
    ok = ok && read_uint(p, "stream_idle_timeout",
                         performance.stream_idle_timeout);
    ok = ok && read_uint(p, "max_streams", performance.max_streams);
    ok = ok && read_uint(p, "max_open_files", performance.max_open_files);
    ok = ok && read_bool(p, "check_pieces_before_read",
                         performance.check_pieces_before_read);
  }
  const Json::Value &l = root["logging"];
  if (l.isObject()) {
    ok = ok && read_string(l, "level", logging.level);
    ok = ok && read_string(l, "file", logging.file);
  }

  if (!ok) {
    logger::log(LOG_ERROR, "Config " + path + " has a value of the wrong type");
    return rqbitfs_errors::parse_error;
  }
  return boost::system::error_code();
}

std::vector<std::string> rqbitfs_config::default_locations() {
  std::vector<std::string> paths;
  const char *xdg = get_env("XDG_CONFIG_HOME");
  const char *home = get_env("HOME");
  if (xdg != NULL && *xdg != '\0')
    paths.push_back((bfs::path(xdg) / "rqbitfs" / "config.json").string());
  else if (home != NULL && *home != '\0')
    paths.push_back((bfs::path(home) / ".config" / "rqbitfs" / "config.json").string());
  paths.push_back("/etc/rqbitfs/config.json");
  paths.push_back("./rqbitfs.json");
  return paths;
}

boost::system::error_code
rqbitfs_config::load_default_locations(std::string &loaded_from) {
  loaded_from.clear();
  std::vector<std::string> paths = default_locations();
  for (size_t i = 0; i < paths.size(); i++) {
    boost::system::error_code ec;
    if (bfs::exists(paths[i], ec)) {
      logger::log(LOG_INFO, "Loading config from: " + paths[i]);
      loaded_from = paths[i];
      return load_file(paths[i]);
    }
  }
  return boost::system::error_code();
}

boost::system::error_code rqbitfs_config::merge_env() {
  const char *val;

  if ((val = get_env("TORRENT_FUSE_API_URL")) != NULL)
    api.url = val;
  if ((val = get_env("TORRENT_FUSE_MOUNT_POINT")) != NULL)
    mount.mount_point = val;
  if (!parse_env_number("TORRENT_FUSE_METADATA_TTL", cache.metadata_ttl)) {
    logger::log(LOG_ERROR, "TORRENT_FUSE_METADATA_TTL has invalid format");
    return rqbitfs_errors::invalid_argument;
  }
  if (!parse_env_number("TORRENT_FUSE_MAX_ENTRIES", cache.max_entries)) {
    logger::log(LOG_ERROR, "TORRENT_FUSE_MAX_ENTRIES has invalid format");
    return rqbitfs_errors::invalid_argument;
  }
  if (!parse_env_number("TORRENT_FUSE_READ_TIMEOUT", performance.read_timeout)) {
    logger::log(LOG_ERROR, "TORRENT_FUSE_READ_TIMEOUT has invalid format");
    return rqbitfs_errors::invalid_argument;
  }
  if ((val = get_env("TORRENT_FUSE_LOG_LEVEL")) != NULL)
    logging.level = val;

  /* the combined form wins over the separate variables */
  if ((val = get_env("TORRENT_FUSE_AUTH_USERPASS")) != NULL) {
    std::string userpass(val);
    std::string::size_type colon = userpass.find(':');
    if (colon != std::string::npos) {
      api.username = userpass.substr(0, colon);
      api.password = userpass.substr(colon + 1);
    }
  } else {
    if ((val = get_env("TORRENT_FUSE_AUTH_USERNAME")) != NULL)
      api.username = val;
    if ((val = get_env("TORRENT_FUSE_AUTH_PASSWORD")) != NULL)
      api.password = val;
  }

  return boost::system::error_code();
}

std::vector<config_issue> rqbitfs_config::validate() const {
  std::vector<config_issue> issues;

  http_endpoint endpoint;
  if (api.url.empty()) {
    config_issue issue = { "api.url", "URL cannot be empty" };
    issues.push_back(issue);
  } else if (!parse_http_url(api.url, endpoint)) {
    config_issue issue = { "api.url", "Invalid URL: " + api.url };
    issues.push_back(issue);
  }

  if (mount.mount_point.empty() || !bfs::path(mount.mount_point).is_absolute()) {
    config_issue issue = { "mount.mount_point", "Mount point must be an absolute path" };
    issues.push_back(issue);
  }

  log_level level;
  if (!logger::parse_level(logging.level, level)) {
    config_issue issue = { "logging.level",
                           "Invalid log level: " + logging.level
                           + ". Must be one of: error, warn, info, debug, trace" };
    issues.push_back(issue);
  }

  if (performance.read_timeout == 0) {
    config_issue issue = { "performance.read_timeout", "Read timeout must be greater than 0" };
    issues.push_back(issue);
  }
  if (performance.worker_threads <= 0) {
    config_issue issue = { "performance.worker_threads", "At least one worker thread is required" };
    issues.push_back(issue);
  }
  if (performance.request_queue_capacity == 0) {
    config_issue issue = { "performance.request_queue_capacity", "Queue capacity must be greater than 0" };
    issues.push_back(issue);
  }
  if (performance.max_streams == 0) {
    config_issue issue = { "performance.max_streams", "At least one stream must be allowed" };
    issues.push_back(issue);
  }

  return issues;
}
