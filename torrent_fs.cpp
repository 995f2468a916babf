#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>
#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/chrono.hpp>
#include <boost/lexical_cast.hpp>
#include "logger.hpp"
#include "rqbitfs_error.hpp"
#include "torrent_fs.hpp"

static const blksize_t BLOCK_SIZE = 4096;

static int64_t steady_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now().time_since_epoch()).count();
}

static std::string child_path(const std::string &parent, const std::string &name) {
  if (parent == "/")
    return "/" + name;
  return parent + "/" + name;
}

static boost::system::error_code no_data() {
  return boost::system::errc::make_error_code(boost::system::errc::no_message_available);
}

static boost::system::error_code out_of_range() {
  return boost::system::errc::make_error_code(boost::system::errc::result_out_of_range);
}

std::string sanitize_filename(const std::string &name) {
  std::string s = boost::algorithm::replace_all_copy(name, "..", "_");
  boost::algorithm::trim(s);
  boost::algorithm::trim_if(s, boost::algorithm::is_any_of("."));
  if (s.empty())
    return "unnamed";

  for (size_t i = 0; i < s.size(); i++) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x20 || c == 0x7f || strchr("/\\:*?\"<>|", c) != NULL)
      s[i] = '_';
  }
  return s;
}

torrent_fs::torrent_fs(inode_namespace &inodes, async_bridge &bridge,
                       torrent_catalog &catalog,
                       const torrent_fs_options &options)
  : inodes(inodes), bridge(bridge), catalog(catalog), options(options),
    file_handles(options.max_open_files), uid(geteuid()), gid(getegid()),
    mount_time(time(NULL)), discovery_stop(false), refresh_wanted(false),
    last_refresh_ms(0) {
}

torrent_fs::~torrent_fs() {
  stop_discovery();
}

void torrent_fs::set_torrent_removed_handler(torrent_removed_handler handler) {
  on_torrent_removed = handler;
}

void torrent_fs::start_discovery() {
  boost::mutex::scoped_lock lock(discovery_mtx);
  if (discovery_thread.joinable())
    return;
  discovery_stop = false;
  discovery_thread = boost::thread(&torrent_fs::discovery_loop, this);
  logger::log(LOG_INFO, "torrent discovery started, interval "
              + boost::lexical_cast<std::string>(options.discovery_interval.count()) + "ms");
}

void torrent_fs::stop_discovery() {
  {
    boost::mutex::scoped_lock lock(discovery_mtx);
    if (!discovery_thread.joinable())
      return;
    discovery_stop = true;
  }
  discovery_cv.notify_all();
  discovery_thread.join();
  logger::log(LOG_INFO, "torrent discovery stopped");
}

void torrent_fs::discovery_loop() {
  boost::unique_lock<boost::mutex> lock(discovery_mtx);
  while (!discovery_stop) {
    refresh_wanted = false;
    lock.unlock();
    boost::system::error_code ec = refresh_torrents();
    if (ec)
      logger::log(LOG_WARN, "torrent discovery failed: " + ec.message());
    lock.lock();

    boost::chrono::steady_clock::time_point deadline =
      boost::chrono::steady_clock::now()
      + boost::chrono::milliseconds(options.discovery_interval.count());
    while (!discovery_stop && !refresh_wanted) {
      if (discovery_cv.wait_until(lock, deadline) == boost::cv_status::timeout)
        break;
    }
  }
}

void torrent_fs::request_refresh() {
  int64_t last = last_refresh_ms.load();
  if (last != 0 && steady_ms() - last < options.refresh_cooldown.count()) {
    logger::log(LOG_TRACE, "skipping refresh, cooldown in effect");
    return;
  }
  {
    boost::mutex::scoped_lock lock(discovery_mtx);
    refresh_wanted = true;
  }
  discovery_cv.notify_all();
}

boost::system::error_code torrent_fs::refresh_torrents() {
  boost::mutex::scoped_lock lock(refresh_mtx);

  torrent_list_result result;
  boost::system::error_code ec = catalog.list_torrents(result);
  if (ec)
    return ec;
  last_refresh_ms.store(steady_ms());

  std::set<uint64_t> current;
  size_t added = 0;
  for (size_t i = 0; i < result.torrents.size(); i++) {
    const torrent_metadata &meta = result.torrents[i];
    current.insert(meta.id);
    if (inodes.lookup_by_torrent(meta.id) != 0)
      continue;
    if (add_torrent(meta) != 0)
      added++;
  }

  /* a torrent whose details failed to load is still there */
  for (size_t i = 0; i < result.errors.size(); i++) {
    current.insert(result.errors[i].id);
    logger::log(LOG_WARN, "skipping torrent " + boost::lexical_cast<std::string>(result.errors[i].id)
                + " (" + result.errors[i].name + "): " + result.errors[i].ec.message());
  }

  size_t removed = 0;
  std::vector<uint64_t> known = inodes.torrent_ids();
  for (size_t i = 0; i < known.size(); i++) {
    if (current.count(known[i]))
      continue;
    logger::log(LOG_INFO, "torrent " + boost::lexical_cast<std::string>(known[i])
                + " is gone from the server, removing it");
    remove_torrent(known[i]);
    removed++;
  }

  if (added || removed)
    logger::log(LOG_INFO, "discovery: " + boost::lexical_cast<std::string>(added)
                + " torrents added, " + boost::lexical_cast<std::string>(removed)
                + " removed");
  return boost::system::error_code();
}

uint64_t torrent_fs::add_torrent(const torrent_metadata &meta) {
  std::string id = boost::lexical_cast<std::string>(meta.id);
  std::string name = sanitize_filename(meta.name);
  if (inodes.lookup_by_path(child_path("/", name)) != 0) {
    logger::log(LOG_WARN, "torrent name " + name + " is taken, using id suffix for torrent " + id);
    name += " [" + id + "]";
  }

  uint64_t dir = inodes.allocate_torrent_directory(meta.id, name);
  if (dir == 0) {
    logger::log(LOG_ERROR, "cannot create directory for torrent " + id);
    return 0;
  }

  if (meta.files.size() == 1) {
    const torrent_file_entry &f = meta.files[0];
    std::string file_name = f.components.empty()
      ? name : sanitize_filename(f.components.back());
    if (inodes.allocate_file(file_name, dir, meta.id, 0, f.length) == 0)
      logger::log(LOG_WARN, "cannot add " + file_name + " of torrent " + id);
  } else {
    for (size_t i = 0; i < meta.files.size(); i++) {
      const torrent_file_entry &f = meta.files[i];
      std::vector<std::string> parts = f.components;
      if (parts.empty())
        boost::split(parts, f.name, boost::is_any_of("/"), boost::token_compress_on);
      parts.erase(std::remove(parts.begin(), parts.end(), std::string()), parts.end());
      if (parts.empty()) {
        logger::log(LOG_WARN, "file " + boost::lexical_cast<std::string>(i)
                    + " of torrent " + id + " has no name");
        continue;
      }

      std::vector<std::string> dirs(parts.begin(), parts.end() - 1);
      uint64_t parent = create_directory_chain(dir, meta.id, dirs);
      if (parent == 0)
        continue;
      if (inodes.allocate_file(sanitize_filename(parts.back()), parent,
                               meta.id, i, f.length) == 0)
        logger::log(LOG_WARN, "cannot add " + f.name + " of torrent " + id);
    }
  }

  logger::log(LOG_INFO, "added torrent " + id + " as /" + name + " ("
              + boost::lexical_cast<std::string>(meta.files.size()) + " files)");
  return dir;
}

uint64_t torrent_fs::create_directory_chain(uint64_t torrent_dir, uint64_t torrent_id,
                                            const std::vector<std::string> &dirs) {
  uint64_t parent = torrent_dir;
  for (size_t i = 0; i < dirs.size(); i++) {
    std::string name = sanitize_filename(dirs[i]);
    uint64_t ino = inodes.lookup_by_path(child_path(inodes.get_path(parent), name));
    inode_entry e;
    if (ino != 0 && inodes.lookup_by_inode(ino, e) && e.is_directory()) {
      parent = ino;
      continue;
    }
    parent = inodes.allocate_directory(name, parent, torrent_id);
    if (parent == 0)
      return 0;
  }
  return parent;
}

void torrent_fs::remove_torrent(uint64_t torrent_id) {
  size_t dropped = file_handles.remove_by_torrent(torrent_id);
  if (dropped)
    logger::log(LOG_DEBUG, "dropped " + boost::lexical_cast<std::string>(dropped)
                + " handles of torrent " + boost::lexical_cast<std::string>(torrent_id));
  if (on_torrent_removed)
    on_torrent_removed(torrent_id);
  uint64_t dir = inodes.lookup_by_torrent(torrent_id);
  if (dir != 0)
    inodes.remove(dir);
}

boost::system::error_code torrent_fs::resolve_path(const std::string &path,
                                                   uint64_t &ino) const {
  std::string p = path;
  while (p.size() > 1 && p[p.size() - 1] == '/')
    p.erase(p.size() - 1);
  ino = p.empty() ? inode_namespace::ROOT_INODE : inodes.lookup_by_path(p);
  if (ino == 0)
    return rqbitfs_errors::not_found;
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::lookup(uint64_t parent, const std::string &name,
                                             uint64_t &ino) const {
  inode_entry dir;
  if (!inodes.lookup_by_inode(parent, dir))
    return rqbitfs_errors::not_found;
  if (!dir.is_directory())
    return rqbitfs_errors::not_directory;

  if (name == ".") {
    ino = parent;
  } else if (name == "..") {
    ino = parent == inode_namespace::ROOT_INODE ? parent : dir.parent;
  } else {
    ino = inodes.lookup_by_path(child_path(inodes.get_path(parent), name));
    if (ino == 0)
      return rqbitfs_errors::not_found;
  }
  return boost::system::error_code();
}

void torrent_fs::fill_stat(const inode_entry &e, struct stat *st) const {
  memset(st, 0, sizeof(struct stat));
  st->st_ino = e.ino;
  st->st_uid = uid;
  st->st_gid = gid;
  st->st_atime = st->st_mtime = st->st_ctime = mount_time;
  st->st_blksize = BLOCK_SIZE;

  switch (e.kind) {
  case INODE_DIRECTORY:
    st->st_mode = S_IFDIR | 0555;
    st->st_nlink = 2 + e.children.size();
    st->st_size = BLOCK_SIZE;
    st->st_blocks = BLOCK_SIZE / 512;
    break;
  case INODE_FILE:
    st->st_mode = S_IFREG | 0444;
    st->st_nlink = 1;
    st->st_size = e.size;
    st->st_blocks = (e.size + 511) / 512;
    break;
  case INODE_SYMLINK:
    st->st_mode = S_IFLNK | 0777;
    st->st_nlink = 1;
    st->st_size = e.target.size();
    break;
  }
}

boost::system::error_code torrent_fs::getattr(uint64_t ino, struct stat *st) const {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  fill_stat(e, st);
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::open(uint64_t ino, int flags, uint64_t &fh) {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  if (e.is_directory())
    return rqbitfs_errors::is_directory;
  if (e.is_symlink())
    return rqbitfs_errors::symlink_loop;
  if ((flags & O_ACCMODE) != O_RDONLY)
    return rqbitfs_errors::read_only_filesystem;

  file_handle_entry h;
  h.ino = ino;
  h.torrent_id = e.torrent_id;
  h.file_index = e.file_index;
  h.size = e.size;
  fh = file_handles.allocate(h);
  if (fh == 0) {
    logger::log(LOG_WARN, "open file limit reached, refusing " + e.name);
    return rqbitfs_errors::too_many_open_files;
  }
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::read(uint64_t fh, uint64_t offset, size_t size,
                                           std::string &out) {
  out.clear();
  file_handle_entry h;
  if (!file_handles.get(fh, h))
    return rqbitfs_errors::bad_file_handle;

  if (size == 0 || offset >= h.size)
    return boost::system::error_code();
  if (offset + size > h.size)
    size = static_cast<size_t>(h.size - offset);

  /* a short reply reads as end of file to the kernel; fill the whole
     request, at most MAX_READ_SIZE per bridge read */
  while (out.size() < size) {
    uint64_t pos = offset + out.size();
    size_t chunk = std::min(size - out.size(), MAX_READ_SIZE);

    if (options.check_pieces_before_read) {
      bridge_reply check = bridge.submit(
        bridge_request::check_pieces(h.torrent_id, h.file_index, pos, chunk),
        options.read_timeout);
      if (check.ec)
        return check.ec;
      if (!check.available) {
        logger::log(LOG_DEBUG, "pieces for torrent "
                    + boost::lexical_cast<std::string>(h.torrent_id) + " file "
                    + boost::lexical_cast<std::string>(h.file_index) + " at "
                    + boost::lexical_cast<std::string>(pos) + " not downloaded yet");
        return rqbitfs_errors::not_ready;
      }
    }

    bridge_reply reply = bridge.submit(
      bridge_request::read_file(h.torrent_id, h.file_index, pos, chunk),
      options.read_timeout);
    if (reply.ec)
      return reply.ec;
    if (reply.data.empty()) {
      logger::log(LOG_WARN, "torrent "
                  + boost::lexical_cast<std::string>(h.torrent_id) + " file "
                  + boost::lexical_cast<std::string>(h.file_index)
                  + " ended early at " + boost::lexical_cast<std::string>(pos));
      break;
    }
    out.append(reply.data, 0, std::min(reply.data.size(), chunk));
  }
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::release(uint64_t fh) {
  if (!file_handles.remove(fh))
    return rqbitfs_errors::bad_file_handle;
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::readdir(uint64_t ino, std::vector<dir_entry> &out) {
  inode_entry dir;
  if (!inodes.lookup_by_inode(ino, dir))
    return rqbitfs_errors::not_found;
  if (!dir.is_directory())
    return rqbitfs_errors::not_directory;

  if (ino == inode_namespace::ROOT_INODE)
    request_refresh();

  out.clear();
  dir_entry dot = { ".", ino, INODE_DIRECTORY };
  dir_entry dotdot = { "..", ino == inode_namespace::ROOT_INODE ? ino : dir.parent,
                       INODE_DIRECTORY };
  out.push_back(dot);
  out.push_back(dotdot);

  std::vector<uint64_t> children = inodes.children_of(ino);
  for (size_t i = 0; i < children.size(); i++) {
    inode_entry child;
    if (!inodes.lookup_by_inode(children[i], child))
      continue;
    dir_entry d = { child.name, child.ino, child.kind };
    out.push_back(d);
  }
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::readlink(uint64_t ino, std::string &target) const {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  if (!e.is_symlink())
    return rqbitfs_errors::invalid_argument;
  target = e.target;
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::unlink(uint64_t parent, const std::string &name) {
  if (parent != inode_namespace::ROOT_INODE)
    return rqbitfs_errors::read_only_filesystem;

  boost::mutex::scoped_lock lock(refresh_mtx);

  uint64_t ino = inodes.lookup_by_path(child_path("/", name));
  inode_entry e;
  if (ino == 0 || !inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  if (!e.is_directory() || e.torrent_id == 0
      || inodes.lookup_by_torrent(e.torrent_id) != ino)
    return rqbitfs_errors::read_only_filesystem;

  if (file_handles.count_for_torrent(e.torrent_id) > 0) {
    logger::log(LOG_WARN, "torrent " + boost::lexical_cast<std::string>(e.torrent_id)
                + " has open files, not removing it");
    return rqbitfs_errors::device_busy;
  }

  bridge_reply reply = bridge.submit(bridge_request::forget_torrent(e.torrent_id),
                                     options.read_timeout);
  if (reply.ec) {
    logger::log(LOG_ERROR, "cannot forget torrent "
                + boost::lexical_cast<std::string>(e.torrent_id) + ": " + reply.ec.message());
    return reply.ec;
  }

  remove_torrent(e.torrent_id);
  logger::log(LOG_INFO, "removed torrent " + boost::lexical_cast<std::string>(e.torrent_id)
              + " (" + name + ")");
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::statfs(struct statvfs *st) const {
  uint64_t total = 0;
  std::vector<uint64_t> pending(1, inode_namespace::ROOT_INODE);
  while (!pending.empty()) {
    inode_entry e;
    uint64_t cur = pending.back();
    pending.pop_back();
    if (!inodes.lookup_by_inode(cur, e))
      continue;
    if (e.is_file())
      total += e.size;
    pending.insert(pending.end(), e.children.begin(), e.children.end());
  }

  memset(st, 0, sizeof(struct statvfs));
  st->f_bsize = BLOCK_SIZE;
  st->f_frsize = BLOCK_SIZE;
  st->f_blocks = (total + BLOCK_SIZE - 1) / BLOCK_SIZE;
  st->f_bfree = 0;
  st->f_bavail = 0;
  st->f_files = inodes.size();
  st->f_ffree = 0;
  st->f_favail = 0;
  st->f_namemax = 255;
  st->f_flag = ST_RDONLY;
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::access(uint64_t ino, int mask) const {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  if (mask & W_OK)
    return rqbitfs_errors::read_only_filesystem;
  if ((mask & X_OK) && e.is_file())
    return rqbitfs_errors::permission_denied;
  return boost::system::error_code();
}

bool torrent_fs::has_status(const inode_entry &e) const {
  if (e.torrent_id == 0)
    return false;
  if (e.is_file())
    return true;
  return e.is_directory() && e.parent == inode_namespace::ROOT_INODE;
}

boost::system::error_code torrent_fs::getxattr(uint64_t ino, const std::string &name,
                                               size_t size, std::string &value) {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  if (name != TORRENT_STATUS_XATTR || !has_status(e))
    return no_data();

  bridge_reply reply = bridge.submit(bridge_request::torrent_status(e.torrent_id),
                                     options.read_timeout);
  if (reply.ec)
    return reply.ec;
  if (size != 0 && reply.data.size() > size)
    return out_of_range();
  value.swap(reply.data);
  return boost::system::error_code();
}

boost::system::error_code torrent_fs::listxattr(uint64_t ino, size_t size,
                                                std::string &names) const {
  inode_entry e;
  if (!inodes.lookup_by_inode(ino, e))
    return rqbitfs_errors::not_found;
  names.clear();
  if (has_status(e))
    names.append(TORRENT_STATUS_XATTR, sizeof(TORRENT_STATUS_XATTR));
  if (size != 0 && names.size() > size)
    return out_of_range();
  return boost::system::error_code();
}
