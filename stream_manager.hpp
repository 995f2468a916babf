// Keeps HTTP streams open across FUSE reads so a sequential reader costs one
// request per file instead of one per read call. Reads of one (torrent, file)
// pair run strictly one after another; different files run in parallel on the
// io_context.

#ifndef stream_manager_h
#define stream_manager_h

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <string>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/unordered_map.hpp>
#include "range_source.hpp"

/* Forward gap that is skipped over instead of reopening the stream */
static const uint64_t DEFAULT_MAX_SEEK_FORWARD = 4 * 1024 * 1024;

/* Large skips hand the thread back to the io_context this often */
static const uint64_t SKIP_YIELD_INTERVAL = 1024 * 1024;

struct stream_key {
  uint64_t torrent_id;
  size_t file_index;

  stream_key() : torrent_id(0), file_index(0) {}
  stream_key(uint64_t t, size_t f) : torrent_id(t), file_index(f) {}

  bool operator==(const stream_key &o) const {
    return torrent_id == o.torrent_id && file_index == o.file_index;
  }
};

size_t hash_value(const stream_key &key);

/* An open HTTP body positioned somewhere inside one file */
class persistent_stream {
public:
  typedef std::chrono::steady_clock clock;

  persistent_stream(boost::shared_ptr<range_body> body, uint64_t position);

  boost::shared_ptr<range_body> body;

  /* absolute offset of the next byte the body will produce */
  uint64_t position;

  /* bytes already received from the body but not yet handed out;
     they start at `position` */
  std::string pending;

  /* set once the transport failed, never cleared */
  bool valid;

  /* the body ended; nothing more can be read */
  bool at_eof;

  clock::time_point last_access;

  /* true when `offset` can be reached by reading forward at most
     `max_seek_forward` bytes */
  bool can_read_at(uint64_t offset, uint64_t max_seek_forward) const;

  /* Moves up to `max` bytes of `pending` into `out` (or drops them when
     `out` is NULL) and advances the position. Returns the count moved. */
  size_t consume_pending(size_t max, std::string *out);

  void close();
};

struct stream_stats {
  size_t active_streams;
  size_t max_streams;
  uint64_t streams_opened;
  uint64_t streams_reused;
  uint64_t bytes_read;
  uint64_t bytes_skipped;
  /* largest body chunk ever held by one stream */
  uint64_t peak_pending_bytes;
};

class stream_manager : public boost::enable_shared_from_this<stream_manager> {
public:
  typedef boost::function<void(const boost::system::error_code&,
                               const std::string&)> read_handler;

  stream_manager(boost::asio::io_context &ioc,
                 boost::shared_ptr<range_source> source,
                 uint64_t max_seek_forward = DEFAULT_MAX_SEEK_FORWARD,
                 std::chrono::seconds idle_timeout = std::chrono::seconds(3600),
                 size_t max_streams = 50);

  ~stream_manager();

  /* Starts the periodic idle sweep */
  void start(std::chrono::milliseconds sweep_interval = std::chrono::seconds(10));

  /* Cancels the sweep and closes every idle stream */
  void stop();

  /* Reads up to `size` bytes at `offset`. Fewer bytes are returned only at
     the end of the file. The handler runs on an io_context thread. */
  void async_read(uint64_t torrent_id, size_t file_index, uint64_t offset,
                  size_t size, read_handler handler);

  void close_stream(uint64_t torrent_id, size_t file_index);

  void close_torrent_streams(uint64_t torrent_id);

  /* Closes streams idle for longer than the idle timeout. Returns how many
     were closed. */
  size_t evict_idle_streams();

  bool has_stream(uint64_t torrent_id, size_t file_index) const;

  stream_stats stats() const;

private:
  friend class stream_read_op;

  struct key_slot {
    boost::shared_ptr<persistent_stream> stream;
    bool busy;
    bool close_requested;
    std::deque<boost::function<void()> > waiting;

    key_slot() : busy(false), close_requested(false) {}
  };

  typedef boost::unordered_map<stream_key, key_slot> slot_map;

  /* Runs `op` once no other operation holds `key` */
  void run_exclusive(const stream_key &key, boost::function<void()> op);

  /* Hands back the stream an operation used and lets the next one in */
  void release(const stream_key &key, boost::shared_ptr<persistent_stream> stream);

  boost::shared_ptr<persistent_stream> current_stream(const stream_key &key) const;

  /* Forgets the stream stored for `key` without closing it */
  void clear_stream(const stream_key &key);

  /* Claims room for a new stream, evicting the least recently used idle
     one if the table is full */
  bool reserve_stream_slot();

  /* Ends a reservation; a non-null stream is stored for `key` */
  void finish_open(const stream_key &key, boost::shared_ptr<persistent_stream> stream);

  void schedule_sweep();

  void note_pending(size_t bytes);

  boost::asio::io_context &ioc;
  boost::shared_ptr<range_source> source;
  uint64_t max_seek_forward;
  std::chrono::seconds idle_timeout;
  size_t max_streams;

  mutable boost::mutex mtx;
  slot_map slots;
  /* streams being opened, counted against max_streams */
  size_t opening;

  boost::asio::steady_timer sweep_timer;
  std::chrono::milliseconds sweep_interval;
  bool sweeping;

  std::atomic<uint64_t> streams_opened;
  std::atomic<uint64_t> streams_reused;
  std::atomic<uint64_t> bytes_read;
  std::atomic<uint64_t> bytes_skipped;
  std::atomic<uint64_t> peak_pending_bytes;
};

#endif //stream_manager_h
