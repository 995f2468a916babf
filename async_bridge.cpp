#include <exception>
#include <boost/asio/post.hpp>
#include <boost/chrono.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include "async_bridge.hpp"
#include "logger.hpp"
#include "rqbitfs_error.hpp"

bridge_request bridge_request::read_file(uint64_t torrent_id, size_t file_index,
                                         uint64_t offset, size_t size) {
  bridge_request r;
  r.kind = REQUEST_READ_FILE;
  r.torrent_id = torrent_id;
  r.file_index = file_index;
  r.offset = offset;
  r.size = size;
  return r;
}

bridge_request bridge_request::check_pieces(uint64_t torrent_id,
                                            size_t file_index,
                                            uint64_t offset, size_t size) {
  bridge_request r = read_file(torrent_id, file_index, offset, size);
  r.kind = REQUEST_CHECK_PIECES;
  return r;
}

bridge_request bridge_request::forget_torrent(uint64_t torrent_id) {
  bridge_request r;
  r.kind = REQUEST_FORGET_TORRENT;
  r.torrent_id = torrent_id;
  return r;
}

bridge_request bridge_request::torrent_status(uint64_t torrent_id) {
  bridge_request r;
  r.kind = REQUEST_TORRENT_STATUS;
  r.torrent_id = torrent_id;
  return r;
}

async_bridge::async_bridge(boost::asio::io_context &ioc,
                           boost::shared_ptr<bridge_backend> backend,
                           size_t queue_capacity)
  : ioc(ioc), backend(backend), capacity(queue_capacity), running(false),
    closed(false) {
}

async_bridge::~async_bridge() {
  shutdown();
}

void async_bridge::start() {
  boost::mutex::scoped_lock lock(queue_mtx);
  if (running || closed)
    return;
  running = true;
  dispatcher = boost::thread(&async_bridge::dispatch_loop, this);
}

bridge_reply async_bridge::submit(const bridge_request &req,
                                  std::chrono::milliseconds timeout) {
  boost::shared_ptr<reply_slot> slot = boost::make_shared<reply_slot>();
  {
    boost::mutex::scoped_lock lock(queue_mtx);
    if (closed)
      return bridge_reply(rqbitfs_errors::worker_disconnected);
    if (queue.size() >= capacity) {
      logger::log(LOG_WARN, "request queue full ("
                  + boost::lexical_cast<std::string>(capacity) + " pending)");
      return bridge_reply(rqbitfs_errors::queue_full);
    }
    pending_request p;
    p.req = req;
    p.slot = slot;
    queue.push_back(p);
  }
  queue_cv.notify_one();

  boost::unique_lock<boost::mutex> lock(slot->mtx);
  boost::chrono::steady_clock::time_point deadline =
    boost::chrono::steady_clock::now() + boost::chrono::milliseconds(timeout.count());
  while (!slot->done) {
    if (slot->cv.wait_until(lock, deadline) == boost::cv_status::timeout
        && !slot->done) {
      slot->abandoned = true;
      logger::log(LOG_DEBUG, "request for torrent "
                  + boost::lexical_cast<std::string>(req.torrent_id)
                  + " timed out after "
                  + boost::lexical_cast<std::string>(timeout.count()) + "ms");
      return bridge_reply(rqbitfs_errors::timed_out);
    }
  }
  return slot->reply;
}

void async_bridge::shutdown() {
  {
    boost::mutex::scoped_lock lock(queue_mtx);
    if (closed)
      return;
    closed = true;
  }
  queue_cv.notify_all();
  if (dispatcher.joinable())
    dispatcher.join();

  /* nothing dequeues any more; answer whatever is left */
  std::deque<pending_request> left;
  {
    boost::mutex::scoped_lock lock(queue_mtx);
    left.swap(queue);
    running = false;
  }
  for (size_t i = 0; i < left.size(); i++)
    deliver(left[i].slot, bridge_reply(rqbitfs_errors::worker_disconnected));
  logger::log(LOG_INFO, "bridge shut down");
}

bool async_bridge::is_running() const {
  boost::mutex::scoped_lock lock(queue_mtx);
  return running && !closed;
}

size_t async_bridge::queued() const {
  boost::mutex::scoped_lock lock(queue_mtx);
  return queue.size();
}

void async_bridge::dispatch_loop() {
  for (;;) {
    pending_request p;
    {
      boost::unique_lock<boost::mutex> lock(queue_mtx);
      while (queue.empty() && !closed)
        queue_cv.wait(lock);
      if (closed)
        return;
      p = queue.front();
      queue.pop_front();
    }
    dispatch(p);
  }
}

void async_bridge::dispatch(const pending_request &p) {
  boost::shared_ptr<bridge_backend> b = backend;
  bridge_request req = p.req;
  boost::shared_ptr<reply_slot> slot = p.slot;

  /* every request runs as its own task so a slow one holds up nothing */
  boost::asio::post(ioc, [b, req, slot]() {
    try {
      b->handle(req, [slot](const bridge_reply &reply) {
        deliver(slot, reply);
      });
    } catch (const std::exception &e) {
      logger::log(LOG_ERROR, std::string("request handler failed: ") + e.what());
      deliver(slot, bridge_reply(rqbitfs_errors::io_error));
    }
  });
}

void async_bridge::deliver(boost::shared_ptr<reply_slot> slot,
                           const bridge_reply &reply) {
  {
    boost::mutex::scoped_lock lock(slot->mtx);
    if (slot->done)
      return;
    slot->done = true;
    if (slot->abandoned) {
      logger::log(LOG_TRACE, "discarding reply for a request that timed out");
      return;
    }
    slot->reply = reply;
  }
  slot->cv.notify_one();
}
