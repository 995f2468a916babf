#include <catch2/catch.hpp>

#include <errno.h>
#include <chrono>
#include <thread>
#include <vector>
#include <boost/asio/error.hpp>
#include <boost/make_shared.hpp>
#include <boost/ref.hpp>
#include <boost/thread/mutex.hpp>
#include "mock_range_source.hpp"
#include "rqbitfs_error.hpp"
#include "stream_manager.hpp"
#include "test_helpers.hpp"

namespace {

  boost::shared_ptr<stream_manager> make_manager(
      io_runner &io, boost::shared_ptr<mock_range_source> source,
      uint64_t max_seek_forward = DEFAULT_MAX_SEEK_FORWARD,
      std::chrono::seconds idle_timeout = std::chrono::seconds(3600),
      size_t max_streams = 50) {
    return boost::make_shared<stream_manager>(boost::ref(io.ioc), source,
                                              max_seek_forward, idle_timeout,
                                              max_streams);
  }

}

TEST_CASE("sequential reads share one stream", "[stream]")
{
  io_runner io;
  std::string content = make_content(64 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  for (uint64_t off = 0; off < 4 * 4096; off += 4096) {
    read_result r = read_sync(*mgr, 1, 0, off, 4096);
    REQUIRE(!r.ec);
    REQUIRE(r.data == content.substr(off, 4096));
  }

  stream_stats s = mgr->stats();
  CHECK(source->opens() == 1);
  CHECK(s.streams_opened == 1);
  CHECK(s.streams_reused == 3);
  CHECK(s.bytes_read == 4 * 4096);
  CHECK(s.active_streams == 1);
  CHECK(mgr->has_stream(1, 0));
}

TEST_CASE("a backward seek opens a new stream", "[stream]")
{
  io_runner io;
  std::string content = make_content(64 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 8192, 4096);
  REQUIRE(!r.ec);
  r = read_sync(*mgr, 1, 0, 0, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(0, 4096));

  std::vector<uint64_t> offsets = source->open_offsets();
  REQUIRE(offsets.size() == 2);
  CHECK(offsets[0] == 8192);
  CHECK(offsets[1] == 0);
  CHECK(source->closed_bodies() == 1);
}

TEST_CASE("a short forward seek skips within the stream", "[stream]")
{
  io_runner io;
  std::string content = make_content(1024 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 0, 100);
  REQUIRE(!r.ec);
  r = read_sync(*mgr, 1, 0, 500000, 100);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(500000, 100));

  CHECK(source->opens() == 1);
  CHECK(mgr->stats().bytes_skipped == 500000 - 100);
}

TEST_CASE("a forward seek beyond the threshold reopens", "[stream]")
{
  io_runner io;
  std::string content = make_content(3 * 1024 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source, 1024 * 1024);

  read_result r = read_sync(*mgr, 1, 0, 0, 100);
  REQUIRE(!r.ec);
  r = read_sync(*mgr, 1, 0, 2 * 1024 * 1024, 100);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(2 * 1024 * 1024, 100));

  std::vector<uint64_t> offsets = source->open_offsets();
  REQUIRE(offsets.size() == 2);
  CHECK(offsets[1] == 2 * 1024 * 1024);
}

TEST_CASE("a server that ignores the range still yields the right bytes", "[stream]")
{
  io_runner io;
  std::string content = make_content(512 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  source->set_ignore_range(true);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 300000, 1000);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(300000, 1000));

  r = read_sync(*mgr, 1, 0, 301000, 1000);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(301000, 1000));
  CHECK(source->opens() == 1);
  CHECK(mgr->stats().bytes_skipped == 300000);
}

TEST_CASE("discarding an ignored range holds one chunk at a time", "[stream]")
{
  io_runner io;
  const size_t chunk = 16 * 1024;
  std::string content = make_content(6 * 1024 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc), chunk);
  source->add_file(1, 0, content);
  source->set_ignore_range(true);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 5 * 1024 * 1024, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(5 * 1024 * 1024, 4096));

  stream_stats stats = mgr->stats();
  CHECK(stats.bytes_skipped == 5 * 1024 * 1024);
  CHECK(stats.peak_pending_bytes > 0);
  CHECK(stats.peak_pending_bytes <= chunk);
}

TEST_CASE("a long skip lets reads of other files through", "[stream]")
{
  /* one io thread, so the skip can only make room by handing it back */
  io_runner io(1);
  std::string big = make_content(4 * 1024 * 1024);
  std::string small = make_content(8 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, big);
  source->add_file(2, 0, small);
  source->set_ignore_range(true);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  boost::mutex mtx;
  std::vector<uint64_t> finished;
  read_waiter big_done;
  read_waiter small_done;
  stream_manager::read_handler big_handler = big_done.handler();
  stream_manager::read_handler small_handler = small_done.handler();

  mgr->async_read(1, 0, 3 * 1024 * 1024, 100,
    [&](const boost::system::error_code &ec, const std::string &data) {
      {
        boost::mutex::scoped_lock lock(mtx);
        finished.push_back(1);
      }
      big_handler(ec, data);
    });
  mgr->async_read(2, 0, 0, 4096,
    [&](const boost::system::error_code &ec, const std::string &data) {
      {
        boost::mutex::scoped_lock lock(mtx);
        finished.push_back(2);
      }
      small_handler(ec, data);
    });

  read_result big_result = big_done.wait();
  read_result small_result = small_done.wait();
  REQUIRE(!big_result.ec);
  REQUIRE(!small_result.ec);
  CHECK(big_result.data == big.substr(3 * 1024 * 1024, 100));
  CHECK(small_result.data == small.substr(0, 4096));

  boost::mutex::scoped_lock lock(mtx);
  REQUIRE(finished.size() == 2);
  CHECK(finished[0] == 2);
  CHECK(finished[1] == 1);
}

TEST_CASE("bytes left over from a chunk serve the next read", "[stream]")
{
  io_runner io;
  std::string content = make_content(64 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc), 16 * 1024);
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 0, 100);
  REQUIRE(!r.ec);
  r = read_sync(*mgr, 1, 0, 100, 100);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(100, 100));

  /* spans the first and second chunk */
  r = read_sync(*mgr, 1, 0, 200, 20000);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(200, 20000));
  CHECK(source->opens() == 1);
}

TEST_CASE("a transport error drops the stream and the next read reopens", "[stream]")
{
  io_runner io;
  std::string content = make_content(64 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc), 4096);
  source->add_file(1, 0, content);
  source->fail_reads_after(1);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 0, 4096);
  REQUIRE(!r.ec);

  r = read_sync(*mgr, 1, 0, 4096, 4096);
  CHECK(r.ec == boost::asio::error::connection_reset);
  CHECK(r.data.empty());
  CHECK(to_errno(r.ec) == EAGAIN);
  CHECK_FALSE(mgr->has_stream(1, 0));
  CHECK(source->closed_bodies() == 1);

  r = read_sync(*mgr, 1, 0, 4096, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(4096, 4096));
  CHECK(source->opens() == 2);
}

TEST_CASE("a failed open is reported and leaves no stream", "[stream]")
{
  io_runner io;
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, make_content(1000));
  source->fail_next_open(rqbitfs_errors::service_unavailable);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 0, 100);
  CHECK(r.ec == rqbitfs_errors::service_unavailable);
  CHECK_FALSE(mgr->has_stream(1, 0));

  r = read_sync(*mgr, 1, 7, 0, 100);
  CHECK(r.ec == rqbitfs_errors::not_found);
  CHECK(mgr->stats().active_streams == 0);
}

TEST_CASE("reads are cut short at the end of the file", "[stream]")
{
  io_runner io;
  std::string content = make_content(10000);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 1, 0, 8000, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(8000));

  r = read_sync(*mgr, 1, 0, 10000, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data.empty());

  r = read_sync(*mgr, 1, 0, 0, 0);
  REQUIRE(!r.ec);
  CHECK(r.data.empty());
}

TEST_CASE("idle streams are evicted", "[stream]")
{
  io_runner io;
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, make_content(8192));
  boost::shared_ptr<stream_manager> mgr =
    make_manager(io, source, DEFAULT_MAX_SEEK_FORWARD, std::chrono::seconds(0));

  REQUIRE(!read_sync(*mgr, 1, 0, 0, 100).ec);
  REQUIRE(mgr->has_stream(1, 0));

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  CHECK(mgr->evict_idle_streams() == 1);
  CHECK_FALSE(mgr->has_stream(1, 0));
  CHECK(source->closed_bodies() == 1);
  CHECK(mgr->evict_idle_streams() == 0);
}

TEST_CASE("the least recently used stream makes room", "[stream]")
{
  io_runner io;
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  for (size_t i = 0; i < 3; i++)
    source->add_file(1, i, make_content(8192));
  boost::shared_ptr<stream_manager> mgr =
    make_manager(io, source, DEFAULT_MAX_SEEK_FORWARD, std::chrono::seconds(3600), 2);

  for (size_t i = 0; i < 3; i++) {
    REQUIRE(!read_sync(*mgr, 1, i, 0, 100).ec);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  stream_stats s = mgr->stats();
  CHECK(s.active_streams == 2);
  CHECK(s.max_streams == 2);
  CHECK_FALSE(mgr->has_stream(1, 0));
  CHECK(mgr->has_stream(1, 1));
  CHECK(mgr->has_stream(1, 2));
}

TEST_CASE("streams of a removed torrent are closed", "[stream]")
{
  io_runner io;
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, make_content(8192));
  source->add_file(1, 1, make_content(8192));
  source->add_file(2, 0, make_content(8192));
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  REQUIRE(!read_sync(*mgr, 1, 0, 0, 100).ec);
  REQUIRE(!read_sync(*mgr, 1, 1, 0, 100).ec);
  REQUIRE(!read_sync(*mgr, 2, 0, 0, 100).ec);

  mgr->close_torrent_streams(1);
  CHECK_FALSE(mgr->has_stream(1, 0));
  CHECK_FALSE(mgr->has_stream(1, 1));
  CHECK(mgr->has_stream(2, 0));
  CHECK(source->closed_bodies() == 2);

  mgr->close_stream(2, 0);
  CHECK(mgr->stats().active_streams == 0);
}

TEST_CASE("queued reads of one file run in order on one stream", "[stream]")
{
  /* a single io thread makes completion order observable */
  io_runner io(1);
  std::string content = make_content(64 * 1024);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc), 4096);
  source->add_file(1, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  boost::mutex mtx;
  boost::condition_variable cv;
  std::vector<uint64_t> order;
  std::vector<std::string> data;
  const size_t count = 6;

  for (size_t i = 0; i < count; i++) {
    uint64_t off = i * 4096;
    mgr->async_read(1, 0, off, 4096,
      [&, off](const boost::system::error_code &ec, const std::string &d) {
        boost::mutex::scoped_lock lock(mtx);
        if (!ec) {
          order.push_back(off);
          data.push_back(d);
        }
        cv.notify_all();
      });
  }

  {
    boost::unique_lock<boost::mutex> lock(mtx);
    while (order.size() < count)
      cv.wait(lock);
  }

  for (size_t i = 0; i < count; i++) {
    CHECK(order[i] == i * 4096);
    CHECK(data[i] == content.substr(i * 4096, 4096));
  }
  CHECK(source->opens() == 1);
}

TEST_CASE("sequential, far and backward reads on a large file", "[stream]")
{
  io_runner io;
  std::string content = make_content(10000000);
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(3, 0, content);
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);

  read_result r = read_sync(*mgr, 3, 0, 0, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(0, 4096));

  r = read_sync(*mgr, 3, 0, 4096, 4096);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(4096, 4096));
  CHECK(source->opens() == 1);

  r = read_sync(*mgr, 3, 0, 9000000, 100);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(9000000, 100));
  CHECK(source->opens() == 2);

  r = read_sync(*mgr, 3, 0, 4096, 50);
  REQUIRE(!r.ec);
  CHECK(r.data == content.substr(4096, 50));

  std::vector<uint64_t> offsets = source->open_offsets();
  REQUIRE(offsets.size() == 3);
  CHECK(offsets[0] == 0);
  CHECK(offsets[1] == 9000000);
  CHECK(offsets[2] == 4096);
  CHECK(mgr->stats().streams_reused == 1);
}

TEST_CASE("stopping the manager closes idle streams", "[stream]")
{
  io_runner io;
  boost::shared_ptr<mock_range_source> source =
    boost::make_shared<mock_range_source>(boost::ref(io.ioc));
  source->add_file(1, 0, make_content(8192));
  boost::shared_ptr<stream_manager> mgr = make_manager(io, source);
  mgr->start(std::chrono::milliseconds(50));

  REQUIRE(!read_sync(*mgr, 1, 0, 0, 100).ec);
  mgr->stop();
  CHECK_FALSE(mgr->has_stream(1, 0));
  CHECK(source->closed_bodies() == 1);
}
