#ifndef file_handles_h
#define file_handles_h

#include <stddef.h>
#include <stdint.h>
#include <boost/thread/mutex.hpp>
#include <boost/unordered_map.hpp>

/* What an open FUSE file handle points at */
struct file_handle_entry {
  uint64_t ino;
  uint64_t torrent_id;
  size_t file_index;
  uint64_t size;

  file_handle_entry() : ino(0), torrent_id(0), file_index(0), size(0) {}
};

/* Numbers open files. Handle 0 is never given out. */
class file_handle_table {
public:
  /* max_handles == 0 means unlimited */
  explicit file_handle_table(size_t max_handles = 0);

  /* 0 when the table is full */
  uint64_t allocate(const file_handle_entry &h);

  bool get(uint64_t fh, file_handle_entry &out) const;

  bool remove(uint64_t fh);

  /* Drops every handle on `torrent_id` and returns how many there were */
  size_t remove_by_torrent(uint64_t torrent_id);

  size_t count_for_torrent(uint64_t torrent_id) const;

  size_t size() const;

private:
  typedef boost::unordered_map<uint64_t, file_handle_entry> handle_map;

  mutable boost::mutex mtx;
  handle_map handles;
  uint64_t next_handle;
  size_t max_handles;
};

#endif //file_handles_h
