// Maps inode numbers onto the torrent tree. The inode table is the only
// owner of entries; the path and torrent indices are derived from it and
// are written after it on insert and before it on removal.

#ifndef inode_namespace_h
#define inode_namespace_h

#include <stdint.h>
#include <atomic>
#include <string>
#include <vector>
#include <boost/thread/mutex.hpp>
#include "concurrent_map.hpp"
#include "inode_entry.hpp"

class inode_namespace {
public:
  static const uint64_t ROOT_INODE = 1;

  /* max_inodes == 0 means unlimited */
  explicit inode_namespace(size_t max_inodes = 0);

  /* Stamps a fresh inode number into `tmpl` and publishes it. Returns 0 if
     the inode limit is reached or the parent is not a directory. */
  uint64_t allocate(const inode_entry &tmpl);

  uint64_t allocate_torrent_directory(uint64_t torrent_id,
                                      const std::string &name,
                                      uint64_t parent = ROOT_INODE);

  uint64_t allocate_directory(const std::string &name, uint64_t parent,
                              uint64_t torrent_id);

  uint64_t allocate_file(const std::string &name, uint64_t parent,
                         uint64_t torrent_id, size_t file_index, uint64_t size);

  uint64_t allocate_symlink(const std::string &name, uint64_t parent,
                            const std::string &target);

  /* Removes `ino` and everything below it. Returns false if `ino` is the
     root or does not exist. */
  bool remove(uint64_t ino);

  bool lookup_by_inode(uint64_t ino, inode_entry &out) const;

  /* 0 when not found */
  uint64_t lookup_by_path(const std::string &path) const;

  /* inode of the torrent's top directory, 0 when not found */
  uint64_t lookup_by_torrent(uint64_t torrent_id) const;

  std::vector<uint64_t> children_of(uint64_t ino) const;

  /* Absolute path of `ino`. Stops early at a missing parent. */
  std::string get_path(uint64_t ino) const;

  bool contains(uint64_t ino) const;

  size_t size() const;

  std::vector<uint64_t> torrent_ids() const;

private:
  std::string build_path(uint64_t parent, const std::string &name) const;

  bool add_child(uint64_t parent, uint64_t child);

  bool remove_child(uint64_t parent, uint64_t child);

  concurrent_map<uint64_t, inode_entry> entries;
  concurrent_map<std::string, uint64_t> path_index;
  concurrent_map<uint64_t, uint64_t> torrent_index;

  /* held by allocate and remove so a parent cannot vanish between its
     check and the child being linked; lookups only take the map locks */
  boost::mutex structure_mtx;

  std::atomic<uint64_t> next_inode;
  size_t max_inodes;
};

#endif //inode_namespace_h
