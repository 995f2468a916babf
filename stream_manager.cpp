#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/functional/hash.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/weak_ptr.hpp>
#include "logger.hpp"
#include "rqbitfs_error.hpp"
#include "stream_manager.hpp"

size_t hash_value(const stream_key &key) {
  size_t seed = 0;
  boost::hash_combine(seed, key.torrent_id);
  boost::hash_combine(seed, key.file_index);
  return seed;
}

static std::string key_string(const stream_key &key) {
  return boost::lexical_cast<std::string>(key.torrent_id) + "/"
    + boost::lexical_cast<std::string>(key.file_index);
}

persistent_stream::persistent_stream(boost::shared_ptr<range_body> body,
                                     uint64_t position)
  : body(body), position(position), valid(true), at_eof(false),
    last_access(clock::now()) {
}

bool persistent_stream::can_read_at(uint64_t offset,
                                    uint64_t max_seek_forward) const {
  return valid && offset >= position && offset - position <= max_seek_forward;
}

size_t persistent_stream::consume_pending(size_t max, std::string *out) {
  size_t n = std::min(max, pending.size());
  if (n == 0)
    return 0;
  if (out != NULL)
    out->append(pending, 0, n);
  pending.erase(0, n);
  position += n;
  return n;
}

void persistent_stream::close() {
  valid = false;
  pending.clear();
  if (body)
    body->close();
}

/* One read, from the decision to reuse or reopen up to the reply. Exactly one
   async step is outstanding at any time, and the manager guarantees nothing
   else touches the stream of this key meanwhile. */
class stream_read_op : public boost::enable_shared_from_this<stream_read_op> {
public:
  stream_read_op(boost::shared_ptr<stream_manager> mgr, const stream_key &key,
                 uint64_t offset, size_t size,
                 stream_manager::read_handler handler)
    : mgr(mgr), key(key), offset(offset), size(size), handler(handler),
      skip_remaining(0), skipped_since_yield(0) {}

  void start() {
    stream = mgr->current_stream(key);

    if (stream && stream->can_read_at(offset, mgr->max_seek_forward)) {
      mgr->streams_reused++;
      skip_remaining = offset - stream->position;
      if (skip_remaining > 0)
        logger::log(LOG_TRACE, "stream " + key_string(key) + ": skipping "
                    + boost::lexical_cast<std::string>(skip_remaining) + " bytes");
      do_skip();
      return;
    }

    if (stream) {
      std::string reason;
      if (!stream->valid)
        reason = "stream is invalid";
      else if (offset < stream->position)
        reason = "backward seek";
      else
        reason = "forward seek beyond threshold";
      logger::log(LOG_DEBUG, "stream " + key_string(key) + ": reopening at "
                  + boost::lexical_cast<std::string>(offset) + " (" + reason + ")");
      mgr->clear_stream(key);
      stream->close();
      stream.reset();
    }

    open_stream();
  }

private:
  void open_stream() {
    if (!mgr->reserve_stream_slot()) {
      logger::log(LOG_WARN, "stream " + key_string(key)
                  + ": too many open streams");
      complete(rqbitfs_errors::too_many_streams);
      return;
    }
    mgr->streams_opened++;

    boost::shared_ptr<stream_read_op> self = shared_from_this();
    mgr->source->async_open(key.torrent_id, key.file_index, offset,
      [self](const boost::system::error_code &ec, int status,
             boost::shared_ptr<range_body> body) {
        self->on_open(ec, status, body);
      });
  }

  void on_open(const boost::system::error_code &ec, int status,
               boost::shared_ptr<range_body> body) {
    if (ec) {
      mgr->finish_open(key, boost::shared_ptr<persistent_stream>());
      logger::log(LOG_WARN, "stream " + key_string(key) + ": open failed: "
                  + ec.message());
      complete(ec);
      return;
    }

    uint64_t start = offset;
    if (status == RANGE_FULL_CONTENT && offset > 0) {
      /* the server ignored the Range header and sends from byte 0 */
      logger::log(LOG_DEBUG, "stream " + key_string(key)
                  + ": full response for range request, discarding "
                  + boost::lexical_cast<std::string>(offset) + " bytes");
      start = 0;
    }

    stream = boost::make_shared<persistent_stream>(body, start);
    mgr->finish_open(key, stream);
    skip_remaining = offset - start;
    do_skip();
  }

  void do_skip() {
    if (skip_remaining > 0 && !stream->pending.empty()) {
      size_t n = stream->consume_pending(
        static_cast<size_t>(std::min<uint64_t>(skip_remaining, stream->pending.size())),
        NULL);
      skip_remaining -= n;
      skipped_since_yield += n;
      mgr->bytes_skipped += n;
    }

    if (skip_remaining == 0) {
      do_read();
      return;
    }

    if (stream->at_eof) {
      /* offset lies past the end of the file */
      complete(boost::system::error_code());
      return;
    }

    boost::shared_ptr<stream_read_op> self = shared_from_this();
    if (skipped_since_yield >= SKIP_YIELD_INTERVAL) {
      skipped_since_yield = 0;
      boost::asio::post(mgr->ioc, [self]() { self->do_skip(); });
      return;
    }

    stream->body->async_read_chunk(
      [self](const boost::system::error_code &ec, const std::string &chunk) {
        self->on_chunk(ec, chunk, true);
      });
  }

  void do_read() {
    if (data.size() < size && !stream->pending.empty())
      mgr->bytes_read += stream->consume_pending(size - data.size(), &data);

    if (data.size() == size || stream->at_eof) {
      complete(boost::system::error_code());
      return;
    }

    boost::shared_ptr<stream_read_op> self = shared_from_this();
    stream->body->async_read_chunk(
      [self](const boost::system::error_code &ec, const std::string &chunk) {
        self->on_chunk(ec, chunk, false);
      });
  }

  void on_chunk(const boost::system::error_code &ec, const std::string &chunk,
                bool skipping) {
    if (ec) {
      stream->valid = false;
      logger::log(LOG_WARN, "stream " + key_string(key) + ": read failed at "
                  + boost::lexical_cast<std::string>(stream->position) + ": "
                  + ec.message());
      complete(ec);
      return;
    }

    if (chunk.empty()) {
      stream->at_eof = true;
    } else {
      stream->pending = chunk;
      mgr->note_pending(chunk.size());
    }

    if (skipping)
      do_skip();
    else
      do_read();
  }

  void complete(const boost::system::error_code &ec) {
    if (stream)
      stream->last_access = persistent_stream::clock::now();
    mgr->release(key, stream);
    stream.reset();
    if (ec)
      handler(ec, std::string());
    else
      handler(ec, data);
  }

  boost::shared_ptr<stream_manager> mgr;
  stream_key key;
  uint64_t offset;
  size_t size;
  stream_manager::read_handler handler;

  boost::shared_ptr<persistent_stream> stream;
  uint64_t skip_remaining;
  uint64_t skipped_since_yield;
  std::string data;
};

stream_manager::stream_manager(boost::asio::io_context &ioc,
                               boost::shared_ptr<range_source> source,
                               uint64_t max_seek_forward,
                               std::chrono::seconds idle_timeout,
                               size_t max_streams)
  : ioc(ioc), source(source), max_seek_forward(max_seek_forward),
    idle_timeout(idle_timeout), max_streams(max_streams), opening(0),
    sweep_timer(ioc), sweep_interval(std::chrono::seconds(10)),
    sweeping(false), streams_opened(0), streams_reused(0), bytes_read(0),
    bytes_skipped(0), peak_pending_bytes(0) {
}

stream_manager::~stream_manager() {
  for (slot_map::iterator it = slots.begin(); it != slots.end(); ++it) {
    if (it->second.stream)
      it->second.stream->close();
  }
}

void stream_manager::start(std::chrono::milliseconds interval) {
  {
    boost::mutex::scoped_lock lock(mtx);
    sweep_interval = interval;
    sweeping = true;
  }
  schedule_sweep();
}

void stream_manager::stop() {
  std::vector<boost::shared_ptr<persistent_stream> > to_close;
  {
    boost::mutex::scoped_lock lock(mtx);
    sweeping = false;
    sweep_timer.cancel();
    for (slot_map::iterator it = slots.begin(); it != slots.end(); ) {
      if (!it->second.busy) {
        if (it->second.stream)
          to_close.push_back(it->second.stream);
        it = slots.erase(it);
      } else {
        it->second.close_requested = true;
        ++it;
      }
    }
  }
  for (size_t i = 0; i < to_close.size(); i++)
    to_close[i]->close();
}

void stream_manager::schedule_sweep() {
  boost::weak_ptr<stream_manager> weak = shared_from_this();
  boost::mutex::scoped_lock lock(mtx);
  if (!sweeping)
    return;
  sweep_timer.expires_after(sweep_interval);
  sweep_timer.async_wait([weak](const boost::system::error_code &ec) {
    if (ec)
      return;
    boost::shared_ptr<stream_manager> self = weak.lock();
    if (!self)
      return;
    self->evict_idle_streams();
    self->schedule_sweep();
  });
}

void stream_manager::async_read(uint64_t torrent_id, size_t file_index,
                                uint64_t offset, size_t size,
                                read_handler handler) {
  stream_key key(torrent_id, file_index);
  if (size == 0) {
    boost::asio::post(ioc, [handler]() {
      handler(boost::system::error_code(), std::string());
    });
    return;
  }
  boost::shared_ptr<stream_read_op> op = boost::make_shared<stream_read_op>(
    shared_from_this(), key, offset, size, handler);
  run_exclusive(key, [op]() { op->start(); });
}

void stream_manager::run_exclusive(const stream_key &key,
                                   boost::function<void()> op) {
  boost::mutex::scoped_lock lock(mtx);
  key_slot &slot = slots[key];
  if (slot.busy) {
    slot.waiting.push_back(op);
    return;
  }
  slot.busy = true;
  boost::asio::post(ioc, op);
}

void stream_manager::release(const stream_key &key,
                             boost::shared_ptr<persistent_stream> stream) {
  boost::shared_ptr<persistent_stream> to_close;
  {
    boost::mutex::scoped_lock lock(mtx);
    key_slot &slot = slots[key];
    if (stream && (!stream->valid || slot.close_requested)) {
      to_close = stream;
      if (slot.stream == stream)
        slot.stream.reset();
    }
    slot.close_requested = false;

    if (!slot.waiting.empty()) {
      boost::function<void()> next = slot.waiting.front();
      slot.waiting.pop_front();
      boost::asio::post(ioc, next);
    } else {
      slot.busy = false;
      if (!slot.stream)
        slots.erase(key);
    }
  }
  if (to_close)
    to_close->close();
}

boost::shared_ptr<persistent_stream>
stream_manager::current_stream(const stream_key &key) const {
  boost::mutex::scoped_lock lock(mtx);
  slot_map::const_iterator it = slots.find(key);
  if (it == slots.end())
    return boost::shared_ptr<persistent_stream>();
  return it->second.stream;
}

void stream_manager::clear_stream(const stream_key &key) {
  boost::mutex::scoped_lock lock(mtx);
  slot_map::iterator it = slots.find(key);
  if (it != slots.end())
    it->second.stream.reset();
}

bool stream_manager::reserve_stream_slot() {
  boost::shared_ptr<persistent_stream> evicted;
  {
    boost::mutex::scoped_lock lock(mtx);
    size_t count = opening;
    slot_map::iterator lru = slots.end();
    for (slot_map::iterator it = slots.begin(); it != slots.end(); ++it) {
      if (!it->second.stream)
        continue;
      count++;
      if (it->second.busy)
        continue;
      if (lru == slots.end()
          || it->second.stream->last_access < lru->second.stream->last_access)
        lru = it;
    }

    if (count >= max_streams) {
      if (lru == slots.end())
        return false;
      logger::log(LOG_DEBUG, "stream table full, closing least recently used "
                  + key_string(lru->first));
      evicted = lru->second.stream;
      slots.erase(lru);
    }
    opening++;
  }
  if (evicted)
    evicted->close();
  return true;
}

void stream_manager::finish_open(const stream_key &key,
                                 boost::shared_ptr<persistent_stream> stream) {
  boost::mutex::scoped_lock lock(mtx);
  opening--;
  if (stream)
    slots[key].stream = stream;
}

void stream_manager::close_stream(uint64_t torrent_id, size_t file_index) {
  boost::shared_ptr<persistent_stream> to_close;
  {
    boost::mutex::scoped_lock lock(mtx);
    slot_map::iterator it = slots.find(stream_key(torrent_id, file_index));
    if (it == slots.end())
      return;
    if (it->second.busy) {
      it->second.close_requested = true;
      return;
    }
    to_close = it->second.stream;
    slots.erase(it);
  }
  if (to_close)
    to_close->close();
}

void stream_manager::close_torrent_streams(uint64_t torrent_id) {
  std::vector<boost::shared_ptr<persistent_stream> > to_close;
  {
    boost::mutex::scoped_lock lock(mtx);
    for (slot_map::iterator it = slots.begin(); it != slots.end(); ) {
      if (it->first.torrent_id != torrent_id) {
        ++it;
      } else if (it->second.busy) {
        it->second.close_requested = true;
        ++it;
      } else {
        if (it->second.stream)
          to_close.push_back(it->second.stream);
        it = slots.erase(it);
      }
    }
  }
  for (size_t i = 0; i < to_close.size(); i++)
    to_close[i]->close();
  if (!to_close.empty())
    logger::log(LOG_DEBUG, "closed " + boost::lexical_cast<std::string>(to_close.size())
                + " streams of torrent " + boost::lexical_cast<std::string>(torrent_id));
}

size_t stream_manager::evict_idle_streams() {
  std::vector<boost::shared_ptr<persistent_stream> > to_close;
  persistent_stream::clock::time_point now = persistent_stream::clock::now();
  {
    boost::mutex::scoped_lock lock(mtx);
    for (slot_map::iterator it = slots.begin(); it != slots.end(); ) {
      key_slot &slot = it->second;
      if (!slot.busy && slot.stream
          && now - slot.stream->last_access > idle_timeout) {
        to_close.push_back(slot.stream);
        it = slots.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (size_t i = 0; i < to_close.size(); i++)
    to_close[i]->close();
  if (!to_close.empty())
    logger::log(LOG_DEBUG, "evicted " + boost::lexical_cast<std::string>(to_close.size())
                + " idle streams");
  return to_close.size();
}

bool stream_manager::has_stream(uint64_t torrent_id, size_t file_index) const {
  return current_stream(stream_key(torrent_id, file_index)).get() != NULL;
}

void stream_manager::note_pending(size_t bytes) {
  uint64_t seen = peak_pending_bytes.load();
  while (bytes > seen && !peak_pending_bytes.compare_exchange_weak(seen, bytes)) {
  }
}

stream_stats stream_manager::stats() const {
  stream_stats s;
  {
    boost::mutex::scoped_lock lock(mtx);
    s.active_streams = 0;
    for (slot_map::const_iterator it = slots.begin(); it != slots.end(); ++it) {
      if (it->second.stream)
        s.active_streams++;
    }
  }
  s.max_streams = max_streams;
  s.streams_opened = streams_opened.load();
  s.streams_reused = streams_reused.load();
  s.bytes_read = bytes_read.load();
  s.bytes_skipped = bytes_skipped.load();
  s.peak_pending_bytes = peak_pending_bytes.load();
  return s;
}
