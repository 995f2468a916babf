// Shared pieces for tests that need a running io_context or a synchronous
// view of the stream manager.

#ifndef test_helpers_h
#define test_helpers_h

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/system/error_code.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "stream_manager.hpp"

/* An io_context served by `threads` threads for the lifetime of the object */
class io_runner {
public:
  explicit io_runner(int threads = 2)
    : work(boost::asio::make_work_guard(ioc)) {
    for (int i = 0; i < threads; i++)
      pool.create_thread([this]() { ioc.run(); });
  }

  ~io_runner() {
    work.reset();
    ioc.stop();
    pool.join_all();
  }

  boost::asio::io_context ioc;

private:
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  boost::thread_group pool;
};

struct read_result {
  boost::system::error_code ec;
  std::string data;
};

/* Waits for one async_read to finish */
class read_waiter {
public:
  read_waiter() : done(false) {}

  stream_manager::read_handler handler() {
    return [this](const boost::system::error_code &ec, const std::string &data) {
      boost::mutex::scoped_lock lock(mtx);
      result.ec = ec;
      result.data = data;
      done = true;
      cv.notify_all();
    };
  }

  read_result wait() {
    boost::unique_lock<boost::mutex> lock(mtx);
    while (!done)
      cv.wait(lock);
    return result;
  }

private:
  boost::mutex mtx;
  boost::condition_variable cv;
  bool done;
  read_result result;
};

inline read_result read_sync(stream_manager &mgr, uint64_t torrent_id,
                             size_t file_index, uint64_t offset, size_t size) {
  read_waiter waiter;
  mgr.async_read(torrent_id, file_index, offset, size, waiter.handler());
  return waiter.wait();
}

/* Deterministic file contents, distinct at every offset within 251 bytes */
inline std::string make_content(size_t size) {
  std::string s(size, '\0');
  for (size_t i = 0; i < size; i++)
    s[i] = static_cast<char>(i % 251);
  return s;
}

#endif //test_helpers_h
