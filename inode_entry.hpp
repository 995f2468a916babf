#ifndef inode_entry_h
#define inode_entry_h

#include <stdint.h>
#include <set>
#include <string>

enum inode_kind {
  INODE_DIRECTORY,
  INODE_FILE,
  INODE_SYMLINK
};

/* One node of the mounted tree. Fields after `parent` only carry meaning
   for the kinds noted next to them. */
struct inode_entry {
  inode_kind kind;

  uint64_t ino;

  /* last path component */
  std::string name;

  uint64_t parent;

  /* torrent the entry belongs to, 0 for entries outside any torrent */
  uint64_t torrent_id;

  /* directory */
  std::set<uint64_t> children;

  /* file */
  size_t file_index;
  uint64_t size;

  /* symlink */
  std::string target;

  inode_entry()
    : kind(INODE_DIRECTORY), ino(0), parent(0), torrent_id(0),
      file_index(0), size(0) {}

  bool is_directory() const { return kind == INODE_DIRECTORY; }
  bool is_file() const { return kind == INODE_FILE; }
  bool is_symlink() const { return kind == INODE_SYMLINK; }

  static inode_entry directory(const std::string &name, uint64_t parent,
                               uint64_t torrent_id = 0) {
    inode_entry e;
    e.kind = INODE_DIRECTORY;
    e.name = name;
    e.parent = parent;
    e.torrent_id = torrent_id;
    return e;
  }

  static inode_entry file(const std::string &name, uint64_t parent,
                          uint64_t torrent_id, size_t file_index,
                          uint64_t size) {
    inode_entry e;
    e.kind = INODE_FILE;
    e.name = name;
    e.parent = parent;
    e.torrent_id = torrent_id;
    e.file_index = file_index;
    e.size = size;
    return e;
  }

  static inode_entry symlink(const std::string &name, uint64_t parent,
                             const std::string &target) {
    inode_entry e;
    e.kind = INODE_SYMLINK;
    e.name = name;
    e.parent = parent;
    e.target = target;
    return e;
  }
};

#endif //inode_entry_h
