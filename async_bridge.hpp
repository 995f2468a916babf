// Hands filesystem requests from FUSE worker threads to the io_context and
// carries each answer back to the one thread waiting for it. FUSE threads
// only ever block on their own reply, and never for longer than the timeout
// they pass in.

#ifndef async_bridge_h
#define async_bridge_h

#include <stddef.h>
#include <stdint.h>
#include <chrono>
#include <deque>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/system/error_code.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

static const size_t DEFAULT_REQUEST_QUEUE_CAPACITY = 1000;

enum bridge_request_kind {
  REQUEST_READ_FILE,
  REQUEST_CHECK_PIECES,
  REQUEST_FORGET_TORRENT,
  REQUEST_TORRENT_STATUS
};

struct bridge_request {
  bridge_request_kind kind;
  uint64_t torrent_id;
  size_t file_index;
  uint64_t offset;
  size_t size;

  bridge_request()
    : kind(REQUEST_READ_FILE), torrent_id(0), file_index(0), offset(0), size(0) {}

  static bridge_request read_file(uint64_t torrent_id, size_t file_index,
                                  uint64_t offset, size_t size);

  static bridge_request check_pieces(uint64_t torrent_id, size_t file_index,
                                     uint64_t offset, size_t size);

  static bridge_request forget_torrent(uint64_t torrent_id);

  static bridge_request torrent_status(uint64_t torrent_id);
};

struct bridge_reply {
  boost::system::error_code ec;

  /* file bytes for reads, a JSON document for status requests */
  std::string data;

  /* answer to a piece check */
  bool available;

  bridge_reply() : available(false) {}

  explicit bridge_reply(const boost::system::error_code &ec)
    : ec(ec), available(false) {}
};

/* Does the actual work of a request on the io_context */
class bridge_backend {
public:
  typedef boost::function<void(const bridge_reply&)> reply_handler;

  virtual ~bridge_backend() {}

  /* Must call `done` exactly once, from any thread */
  virtual void handle(const bridge_request &req, reply_handler done) = 0;

  /* Waits for work started by handle() outside the io_context */
  virtual void stop() {}
};

class async_bridge {
public:
  async_bridge(boost::asio::io_context &ioc,
               boost::shared_ptr<bridge_backend> backend,
               size_t queue_capacity = DEFAULT_REQUEST_QUEUE_CAPACITY);

  ~async_bridge();

  /* Starts the dispatcher thread */
  void start();

  /* Called from FUSE threads. Fails with queue_full when the queue is
     saturated, timed_out when no reply arrives within `timeout`, and
     worker_disconnected once the bridge is shut down. */
  bridge_reply submit(const bridge_request &req,
                      std::chrono::milliseconds timeout);

  /* Stops accepting requests. Requests still queued are answered with
     worker_disconnected; those already handed to the backend finish. */
  void shutdown();

  bool is_running() const;

  size_t queued() const;

private:
  struct reply_slot {
    boost::mutex mtx;
    boost::condition_variable cv;
    bool done;
    /* the caller timed out and no longer waits */
    bool abandoned;
    bridge_reply reply;

    reply_slot() : done(false), abandoned(false) {}
  };

  struct pending_request {
    bridge_request req;
    boost::shared_ptr<reply_slot> slot;
  };

  void dispatch_loop();

  void dispatch(const pending_request &p);

  static void deliver(boost::shared_ptr<reply_slot> slot,
                      const bridge_reply &reply);

  boost::asio::io_context &ioc;
  boost::shared_ptr<bridge_backend> backend;
  size_t capacity;

  mutable boost::mutex queue_mtx;
  boost::condition_variable queue_cv;
  std::deque<pending_request> queue;
  bool running;
  bool closed;

  boost::thread dispatcher;
};

#endif //async_bridge_h
