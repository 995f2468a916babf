#include <stdexcept>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include "inode_namespace.hpp"
#include "logger.hpp"

const uint64_t inode_namespace::ROOT_INODE;

/* Guards path building against parent cycles */
static const int MAX_PATH_DEPTH = 4096;

namespace {

  struct child_adder {
    uint64_t child;
    void operator()(inode_entry &e) const { e.children.insert(child); }
  };

  struct child_remover {
    uint64_t child;
    void operator()(inode_entry &e) const { e.children.erase(child); }
  };

}

inode_namespace::inode_namespace(size_t max_inodes)
  : next_inode(ROOT_INODE + 1), max_inodes(max_inodes) {
  inode_entry root = inode_entry::directory("", ROOT_INODE);
  root.ino = ROOT_INODE;
  entries.insert(ROOT_INODE, root);
  path_index.insert("/", ROOT_INODE);
}

uint64_t inode_namespace::allocate(const inode_entry &tmpl) {
  boost::mutex::scoped_lock lock(structure_mtx);
  if (max_inodes != 0 && entries.size() >= max_inodes) {
    logger::log(LOG_WARN, "Inode limit reached ("
                + boost::lexical_cast<std::string>(max_inodes)
                + "), not adding " + tmpl.name);
    return 0;
  }

  inode_entry parent;
  if (!entries.get(tmpl.parent, parent) || !parent.is_directory()) {
    logger::log(LOG_WARN, "Parent " + boost::lexical_cast<std::string>(tmpl.parent)
                + " of " + tmpl.name + " is not a directory");
    return 0;
  }

  inode_entry entry = tmpl;
  entry.ino = next_inode.fetch_add(1);
  entry.children.clear();

  std::string path = build_path(entry.parent, entry.name);

  if (!entries.insert(entry.ino, entry))
    throw std::logic_error("inode number "
                           + boost::lexical_cast<std::string>(entry.ino)
                           + " allocated twice");

  path_index.insert_or_assign(path, entry.ino);
  if (entry.is_directory() && entry.parent == ROOT_INODE
      && entry.torrent_id != 0)
    torrent_index.insert_or_assign(entry.torrent_id, entry.ino);

  if (!add_child(entry.parent, entry.ino))
    throw std::logic_error("parent of inode "
                           + boost::lexical_cast<std::string>(entry.ino)
                           + " vanished while linking it");

  logger::log(LOG_TRACE, "allocated inode "
              + boost::lexical_cast<std::string>(entry.ino) + " for " + path);
  return entry.ino;
}

uint64_t inode_namespace::allocate_torrent_directory(uint64_t torrent_id,
                                                     const std::string &name,
                                                     uint64_t parent) {
  return allocate(inode_entry::directory(name, parent, torrent_id));
}

uint64_t inode_namespace::allocate_directory(const std::string &name,
                                             uint64_t parent,
                                             uint64_t torrent_id) {
  return allocate(inode_entry::directory(name, parent, torrent_id));
}

uint64_t inode_namespace::allocate_file(const std::string &name,
                                        uint64_t parent, uint64_t torrent_id,
                                        size_t file_index, uint64_t size) {
  return allocate(inode_entry::file(name, parent, torrent_id, file_index, size));
}

uint64_t inode_namespace::allocate_symlink(const std::string &name,
                                           uint64_t parent,
                                           const std::string &target) {
  return allocate(inode_entry::symlink(name, parent, target));
}

bool inode_namespace::remove(uint64_t ino) {
  if (ino == ROOT_INODE)
    return false;

  boost::mutex::scoped_lock lock(structure_mtx);
  inode_entry top;
  if (!entries.get(ino, top))
    return false;

  /* pre-order walk; removing in reverse drops children before parents */
  std::vector<uint64_t> order;
  std::vector<uint64_t> pending(1, ino);
  while (!pending.empty()) {
    uint64_t cur = pending.back();
    pending.pop_back();
    inode_entry e;
    if (!entries.get(cur, e))
      continue;
    order.push_back(cur);
    pending.insert(pending.end(), e.children.begin(), e.children.end());
  }

  for (std::vector<uint64_t>::reverse_iterator it = order.rbegin();
       it != order.rend(); ++it) {
    inode_entry e;
    if (!entries.get(*it, e))
      continue;
    remove_child(e.parent, e.ino);
    path_index.erase_if_equal(get_path(e.ino), e.ino);
    if (e.torrent_id != 0)
      torrent_index.erase_if_equal(e.torrent_id, e.ino);
    entries.erase(e.ino);
  }

  logger::log(LOG_DEBUG, "removed inode " + boost::lexical_cast<std::string>(ino)
              + " and " + boost::lexical_cast<std::string>(order.size() - 1)
              + " descendants");
  return true;
}

bool inode_namespace::lookup_by_inode(uint64_t ino, inode_entry &out) const {
  return entries.get(ino, out);
}

uint64_t inode_namespace::lookup_by_path(const std::string &path) const {
  uint64_t ino = 0;
  if (!path_index.get(path, ino))
    return 0;
  /* the index may briefly outlive the entry during removal */
  if (!entries.contains(ino))
    return 0;
  return ino;
}

uint64_t inode_namespace::lookup_by_torrent(uint64_t torrent_id) const {
  uint64_t ino = 0;
  if (!torrent_index.get(torrent_id, ino))
    return 0;
  if (!entries.contains(ino))
    return 0;
  return ino;
}

std::vector<uint64_t> inode_namespace::children_of(uint64_t ino) const {
  inode_entry e;
  if (!entries.get(ino, e) || !e.is_directory())
    return std::vector<uint64_t>();
  if (!e.children.empty())
    return std::vector<uint64_t>(e.children.begin(), e.children.end());

  /* a child whose add_child has not landed yet is still found by its parent */
  std::vector<uint64_t> found;
  std::vector<std::pair<uint64_t, inode_entry> > all = entries.snapshot();
  for (size_t i = 0; i < all.size(); i++)
    if (all[i].first != ROOT_INODE && all[i].second.parent == ino)
      found.push_back(all[i].first);
  std::sort(found.begin(), found.end());
  return found;
}

std::string inode_namespace::get_path(uint64_t ino) const {
  if (ino == ROOT_INODE)
    return "/";
  inode_entry e;
  if (!entries.get(ino, e))
    return "";
  return build_path(e.parent, e.name);
}

std::string inode_namespace::build_path(uint64_t parent,
                                        const std::string &name) const {
  std::vector<std::string> parts;
  parts.push_back(name);

  uint64_t cur = parent;
  for (int depth = 0; cur != ROOT_INODE && depth < MAX_PATH_DEPTH; depth++) {
    inode_entry e;
    if (!entries.get(cur, e)) {
      logger::log(LOG_WARN, "dangling parent " + boost::lexical_cast<std::string>(cur)
                  + " while building path for " + name);
      break;
    }
    parts.push_back(e.name);
    cur = e.parent;
  }

  std::string path;
  for (std::vector<std::string>::reverse_iterator it = parts.rbegin();
       it != parts.rend(); ++it) {
    path += "/";
    path += *it;
  }
  return path;
}

bool inode_namespace::contains(uint64_t ino) const {
  return entries.contains(ino);
}

size_t inode_namespace::size() const {
  return entries.size();
}

std::vector<uint64_t> inode_namespace::torrent_ids() const {
  std::vector<std::pair<uint64_t, uint64_t> > all = torrent_index.snapshot();
  std::vector<uint64_t> ids;
  for (size_t i = 0; i < all.size(); i++)
    ids.push_back(all[i].first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

bool inode_namespace::add_child(uint64_t parent, uint64_t child) {
  child_adder f = { child };
  return entries.update(parent, f);
}

bool inode_namespace::remove_child(uint64_t parent, uint64_t child) {
  child_remover f = { child };
  return entries.update(parent, f);
}
