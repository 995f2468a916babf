// The read-only filesystem, addressed by inode number. FS.cpp only turns
// FUSE paths into inodes and forwards here; everything that touches the
// namespace, file handles or the async side lives in this class.

#ifndef torrent_fs_h
#define torrent_fs_h

#include <stddef.h>
#include <stdint.h>
#include <time.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <boost/function.hpp>
#include <boost/system/error_code.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "async_bridge.hpp"
#include "file_handles.hpp"
#include "inode_namespace.hpp"
#include "torrent_catalog.hpp"

/* Largest read handed to the async side in one go */
static const size_t MAX_READ_SIZE = 64 * 1024;

static const char TORRENT_STATUS_XATTR[] = "user.torrent.status";

struct torrent_fs_options {
  /* how long a FUSE thread waits for the async side */
  std::chrono::milliseconds read_timeout;
  /* 0 means unlimited */
  size_t max_open_files;
  bool check_pieces_before_read;
  std::chrono::milliseconds discovery_interval;
  /* minimum gap between refreshes triggered by listing the root */
  std::chrono::milliseconds refresh_cooldown;

  torrent_fs_options()
    : read_timeout(std::chrono::seconds(30)), max_open_files(0),
      check_pieces_before_read(false),
      discovery_interval(std::chrono::seconds(30)),
      refresh_cooldown(std::chrono::seconds(5)) {}
};

struct dir_entry {
  std::string name;
  uint64_t ino;
  inode_kind kind;
};

/* Replaces characters that cannot or should not appear in a file name */
std::string sanitize_filename(const std::string &name);

class torrent_fs {
public:
  typedef boost::function<void(uint64_t)> torrent_removed_handler;

  torrent_fs(inode_namespace &inodes, async_bridge &bridge,
             torrent_catalog &catalog,
             const torrent_fs_options &options = torrent_fs_options());

  ~torrent_fs();

  /* Called with the torrent id after its handles are dropped and before its
     inodes go away */
  void set_torrent_removed_handler(torrent_removed_handler handler);

  /* Starts the background discovery thread */
  void start_discovery();

  void stop_discovery();

  /* Synchronises the tree with the torrents the server knows about */
  boost::system::error_code refresh_torrents();

  /* Wakes the discovery thread unless a refresh ran within the cooldown */
  void request_refresh();

  /* Builds the directory tree of one torrent. Returns the inode of its
     top directory, 0 on failure. */
  uint64_t add_torrent(const torrent_metadata &meta);

  /* Drops handles, streams and inodes of one torrent */
  void remove_torrent(uint64_t torrent_id);

  /* 0 and not_found when `path` does not exist */
  boost::system::error_code resolve_path(const std::string &path, uint64_t &ino) const;

  boost::system::error_code lookup(uint64_t parent, const std::string &name,
                                   uint64_t &ino) const;

  boost::system::error_code getattr(uint64_t ino, struct stat *st) const;

  boost::system::error_code open(uint64_t ino, int flags, uint64_t &fh);

  boost::system::error_code read(uint64_t fh, uint64_t offset, size_t size,
                                 std::string &out);

  boost::system::error_code release(uint64_t fh);

  boost::system::error_code readdir(uint64_t ino, std::vector<dir_entry> &out);

  boost::system::error_code readlink(uint64_t ino, std::string &target) const;

  /* Forgets a torrent when `name` is a torrent directory in the root */
  boost::system::error_code unlink(uint64_t parent, const std::string &name);

  boost::system::error_code statfs(struct statvfs *st) const;

  boost::system::error_code access(uint64_t ino, int mask) const;

  /* `size` is the caller's buffer; 0 asks for the length only */
  boost::system::error_code getxattr(uint64_t ino, const std::string &name,
                                     size_t size, std::string &value);

  /* NUL separated attribute names */
  boost::system::error_code listxattr(uint64_t ino, size_t size,
                                      std::string &names) const;

  const file_handle_table& handles() const { return file_handles; }

private:
  /* torrent directory directly under the root, or a file of a torrent */
  bool has_status(const inode_entry &e) const;

  uint64_t create_directory_chain(uint64_t torrent_dir, uint64_t torrent_id,
                                  const std::vector<std::string> &dirs);

  void fill_stat(const inode_entry &e, struct stat *st) const;

  void discovery_loop();

  inode_namespace &inodes;
  async_bridge &bridge;
  torrent_catalog &catalog;
  torrent_fs_options options;
  file_handle_table file_handles;
  torrent_removed_handler on_torrent_removed;

  uid_t uid;
  gid_t gid;
  time_t mount_time;

  /* serialises structural changes made by refreshes and unlink */
  boost::mutex refresh_mtx;

  boost::mutex discovery_mtx;
  boost::condition_variable discovery_cv;
  bool discovery_stop;
  bool refresh_wanted;
  boost::thread discovery_thread;
  /* steady clock ms of the last successful refresh, 0 before the first */
  std::atomic<int64_t> last_refresh_ms;
};

#endif //torrent_fs_h
