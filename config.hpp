// Runtime configuration for rqbitfs. Values come from built-in defaults, a
// JSON config file, TORRENT_FUSE_* environment variables and the command
// line, each layer overriding the previous one.

#ifndef config_h
#define config_h

#include <stdint.h>
#include <string>
#include <vector>
#include <boost/system/error_code.hpp>

struct api_config {
  std::string url;
  std::string username;
  std::string password;
};

struct cache_config {
  /* seconds a torrent's metadata stays cached */
  uint64_t metadata_ttl;
  size_t max_entries;
};

struct mount_config {
  std::string mount_point;
  bool allow_other;
};

struct performance_config {
  /* seconds a FUSE thread waits for a reply from the async side */
  uint64_t read_timeout;
  int worker_threads;
  size_t request_queue_capacity;
  /* forward gap in bytes that is skipped instead of reopening a stream */
  uint64_t stream_seek_threshold;
  /* seconds before an unused stream is closed */
  uint64_t stream_idle_timeout;
  size_t max_streams;
  /* 0 means no limit */
  size_t max_open_files;
  bool check_pieces_before_read;
};

struct logging_config {
  std::string level;
  /* empty for stderr */
  std::string file;
};

struct config_issue {
  std::string field;
  std::string message;
};

class rqbitfs_config {
public:
  api_config api;
  cache_config cache;
  mount_config mount;
  performance_config performance;
  logging_config logging;

  rqbitfs_config();

  /* Overlays the values found in a JSON file on top of this config */
  boost::system::error_code load_file(const std::string &path);

  /* Loads the first config file that exists in the standard locations.
     `loaded_from` is left empty when none is found. */
  boost::system::error_code load_default_locations(std::string &loaded_from);

  boost::system::error_code merge_env();

  std::vector<config_issue> validate() const;

  static std::vector<std::string> default_locations();
};

#endif //config_h
