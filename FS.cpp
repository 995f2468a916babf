#include <algorithm>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include "FS.hpp"
#include "logger.hpp"
#include "rqbitfs_error.hpp"

FS* FS::_instance = NULL;

#define RETURN_ERRNO(ec) ((ec) ? -to_errno(ec) : 0)

FS* FS::Instance() {
  if(_instance == NULL) {
    _instance = new FS();
  }
  return _instance;
}

FS::FS() : tfs(NULL) {
}

FS::~FS() {
}

void FS::attach(boost::function<torrent_fs*()> init_handler,
                boost::function<void()> destroy_handler) {
  on_init = init_handler;
  on_destroy = destroy_handler;
}

int FS::resolve(const char *path, uint64_t &ino) {
  if (tfs == NULL)
    return -EIO;
  boost::system::error_code ec = tfs->resolve_path(path, ino);
  return RETURN_ERRNO(ec);
}

/* "/a/b" -> inode of "/a" and "b" */
int FS::split_parent(const char *path, uint64_t &parent, std::string &name) {
  std::string p(path);
  std::string::size_type slash = p.find_last_of('/');
  if (slash == std::string::npos)
    return -ENOENT;
  name = p.substr(slash + 1);
  std::string dir = slash == 0 ? "/" : p.substr(0, slash);
  return resolve(dir.c_str(), parent);
}

int FS::getattr(const char *path, struct stat *statbuf) {
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  return RETURN_ERRNO(tfs->getattr(ino, statbuf));
}

int FS::readlink(const char *path, char *link, size_t size) {
  logger::log(LOG_DEBUG, std::string("readlink ") + path);
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  std::string target;
  boost::system::error_code ec = tfs->readlink(ino, target);
  if (ec)
    return -to_errno(ec);
  if (size == 0)
    return -EINVAL;
  /* fuse wants a NUL terminated, possibly truncated target */
  size_t n = std::min(size - 1, target.size());
  memcpy(link, target.data(), n);
  link[n] = '\0';
  return 0;
}

int FS::open(const char *path, struct fuse_file_info *fileInfo) {
  logger::log(LOG_DEBUG, std::string("open ") + path);
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  uint64_t fh = 0;
  boost::system::error_code ec = tfs->open(ino, fileInfo->flags, fh);
  if (ec)
    return -to_errno(ec);
  fileInfo->fh = fh;
  fileInfo->keep_cache = 1;
  return 0;
}

int FS::read(const char *path, char *buf, size_t size,
             off_t offset, struct fuse_file_info *fileInfo) {
  if (logger::enabled(LOG_DEBUG))
    logger::log(LOG_DEBUG, std::string("read ") + path + " offset "
                + boost::lexical_cast<std::string>(offset) + " size "
                + boost::lexical_cast<std::string>(size));
  if (tfs == NULL)
    return -EIO;
  if (offset < 0)
    return -EINVAL;

  std::string data;
  boost::system::error_code ec =
    tfs->read(fileInfo->fh, static_cast<uint64_t>(offset), size, data);
  if (ec) {
    logger::log(LOG_WARN, std::string("read of ") + path + " failed: " + ec.message());
    return -to_errno(ec);
  }
  size_t n = std::min(size, data.size());
  memcpy(buf, data.data(), n);
  return static_cast<int>(n);
}

int FS::release(const char *path, struct fuse_file_info *fileInfo) {
  logger::log(LOG_DEBUG, std::string("release ") + path);
  if (tfs == NULL)
    return -EIO;
  return RETURN_ERRNO(tfs->release(fileInfo->fh));
}

int FS::opendir(const char *path, struct fuse_file_info *fileInfo) {
  (void) fileInfo;
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  struct stat st;
  boost::system::error_code ec = tfs->getattr(ino, &st);
  if (ec)
    return -to_errno(ec);
  return S_ISDIR(st.st_mode) ? 0 : -ENOTDIR;
}

int FS::readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                off_t offset, struct fuse_file_info *fi) {
  (void) offset;
  (void) fi;
  logger::log(LOG_DEBUG, std::string("readdir ") + path);

  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;

  std::vector<dir_entry> entries;
  boost::system::error_code ec = tfs->readdir(ino, entries);
  if (ec)
    return -to_errno(ec);

  for (size_t i = 0; i < entries.size(); i++) {
    struct stat st;
    memset(&st, 0, sizeof(st));
    st.st_ino = entries[i].ino;
    switch (entries[i].kind) {
    case INODE_DIRECTORY: st.st_mode = S_IFDIR; break;
    case INODE_FILE: st.st_mode = S_IFREG; break;
    case INODE_SYMLINK: st.st_mode = S_IFLNK; break;
    }
    if (filler(buf, entries[i].name.c_str(), &st, 0) != 0)
      break;
  }
  return 0;
}

int FS::statfs(const char *path, struct statvfs *statInfo) {
  (void) path;
  if (tfs == NULL)
    return -EIO;
  return RETURN_ERRNO(tfs->statfs(statInfo));
}

int FS::access(const char *path, int mask) {
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  return RETURN_ERRNO(tfs->access(ino, mask));
}

int FS::getxattr(const char *path, const char *name, char *value, size_t size) {
  logger::log(LOG_DEBUG, std::string("getxattr ") + path + " " + name);
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  std::string data;
  boost::system::error_code ec = tfs->getxattr(ino, name, size, data);
  if (ec)
    return -to_errno(ec);
  if (size != 0)
    memcpy(value, data.data(), data.size());
  return static_cast<int>(data.size());
}

int FS::listxattr(const char *path, char *list, size_t size) {
  uint64_t ino;
  int err = resolve(path, ino);
  if (err)
    return err;
  std::string names;
  boost::system::error_code ec = tfs->listxattr(ino, size, names);
  if (ec)
    return -to_errno(ec);
  if (size != 0)
    memcpy(list, names.data(), names.size());
  return static_cast<int>(names.size());
}

int FS::unlink(const char *path) {
  logger::log(LOG_INFO, std::string("unlink ") + path);
  uint64_t parent;
  std::string name;
  int err = split_parent(path, parent, name);
  if (err)
    return err;
  return RETURN_ERRNO(tfs->unlink(parent, name));
}

int FS::read_only(const char *path, const char *op) {
  logger::log(LOG_DEBUG, std::string(op) + " " + path + " refused on read-only filesystem");
  return -EROFS;
}

void* FS::init(struct fuse_conn_info *conn) {
  (void) conn;
  logger::log(LOG_INFO, "filesystem mounted");
  if (on_init)
    tfs = on_init();
  if (tfs != NULL)
    tfs->start_discovery();
  else
    logger::log(LOG_ERROR, "no filesystem attached, every call fails with EIO");
  return NULL;
}

void FS::destroy(void *private_data) {
  (void) private_data;
  logger::log(LOG_INFO, "filesystem unmounting");
  if (tfs != NULL)
    tfs->stop_discovery();
  tfs = NULL;
  if (on_destroy)
    on_destroy();
}
