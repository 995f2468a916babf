#include "file_handles.hpp"

file_handle_table::file_handle_table(size_t max_handles)
  : next_handle(1), max_handles(max_handles) {
}

uint64_t file_handle_table::allocate(const file_handle_entry &h) {
  boost::mutex::scoped_lock lock(mtx);
  if (max_handles != 0 && handles.size() >= max_handles)
    return 0;
  uint64_t fh = next_handle++;
  handles[fh] = h;
  return fh;
}

bool file_handle_table::get(uint64_t fh, file_handle_entry &out) const {
  boost::mutex::scoped_lock lock(mtx);
  handle_map::const_iterator it = handles.find(fh);
  if (it == handles.end())
    return false;
  out = it->second;
  return true;
}

bool file_handle_table::remove(uint64_t fh) {
  boost::mutex::scoped_lock lock(mtx);
  return handles.erase(fh) > 0;
}

size_t file_handle_table::remove_by_torrent(uint64_t torrent_id) {
  boost::mutex::scoped_lock lock(mtx);
  size_t removed = 0;
  for (handle_map::iterator it = handles.begin(); it != handles.end(); ) {
    if (it->second.torrent_id == torrent_id) {
      it = handles.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t file_handle_table::count_for_torrent(uint64_t torrent_id) const {
  boost::mutex::scoped_lock lock(mtx);
  size_t n = 0;
  for (handle_map::const_iterator it = handles.begin(); it != handles.end(); ++it)
    if (it->second.torrent_id == torrent_id)
      n++;
  return n;
}

size_t file_handle_table::size() const {
  boost::mutex::scoped_lock lock(mtx);
  return handles.size();
}
