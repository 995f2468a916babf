// FUSE front end of rqbitfs. Implements the high level libfuse 2.6 path API
// on top of torrent_fs: each call resolves its path to an inode and forwards.
// Anything that would modify the tree is refused with EROFS, except unlink of
// a torrent directory in the root, which forgets that torrent.

#ifndef FS_h
#define FS_h

#define FUSE_USE_VERSION 26

#include <errno.h>
#include <fcntl.h>
#include <fuse.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <boost/function.hpp>
#include "torrent_fs.hpp"

class FS {
private:

  static FS *_instance;

  torrent_fs *tfs;
  boost::function<torrent_fs*()> on_init;
  boost::function<void()> on_destroy;

  int resolve(const char *path, uint64_t &ino);
  int split_parent(const char *path, uint64_t &parent, std::string &name);

public:
  static FS *Instance();

  FS();
  ~FS();

  /* `init_handler` runs from the FUSE init callback, after libfuse has
     daemonized, and returns the filesystem to serve */
  void attach(boost::function<torrent_fs*()> init_handler,
              boost::function<void()> destroy_handler);

  int getattr(const char *path, struct stat *statbuf);
  int readlink(const char *path, char *link, size_t size);
  int open(const char *path, struct fuse_file_info *fileInfo);
  int read(const char *path, char *buf, size_t size, off_t offset, struct fuse_file_info *fileInfo);
  int release(const char *path, struct fuse_file_info *fileInfo);
  int opendir(const char *path, struct fuse_file_info *fileInfo);
  int readdir(const char *path, void *buf, fuse_fill_dir_t filler, off_t offset, struct fuse_file_info *fileInfo);
  int statfs(const char *path, struct statvfs *statInfo);
  int access(const char *path, int mask);
  int getxattr(const char *path, const char *name, char *value, size_t size);
  int listxattr(const char *path, char *list, size_t size);
  int unlink(const char *path);
  int read_only(const char *path, const char *op);
  void* init(struct fuse_conn_info *conn);
  void destroy(void *private_data);
};

#endif //FS_h
