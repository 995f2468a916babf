#include <catch2/catch.hpp>

#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <atomic>
#include <chrono>
#include <string>
#include <boost/make_shared.hpp>
#include <boost/ref.hpp>
#include "mock_range_source.hpp"
#include "mount_runtime.hpp"
#include "rqbitfs_error.hpp"
#include "test_helpers.hpp"

namespace {

  const uint64_t MOVIE_SIZE = 200000;

  class movie_catalog : public torrent_catalog {
  public:
    boost::system::error_code list_torrents(torrent_list_result &out) {
      torrent_metadata meta;
      meta.id = 1;
      meta.name = "Movie";
      torrent_file_entry f;
      f.name = "movie.mkv";
      f.length = MOVIE_SIZE;
      f.components.push_back("movie.mkv");
      meta.files.push_back(f);
      out = torrent_list_result();
      out.torrents.push_back(meta);
      return boost::system::error_code();
    }
  };

  /* Reads go to the stream manager, nothing else is supported */
  class read_only_backend : public bridge_backend {
  public:
    explicit read_only_backend(boost::shared_ptr<stream_manager> streams)
      : streams(streams) {}

    void handle(const bridge_request &req, reply_handler done) {
      if (req.kind != REQUEST_READ_FILE) {
        done(bridge_reply(rqbitfs_errors::invalid_argument));
        return;
      }
      streams->async_read(req.torrent_id, req.file_index, req.offset, req.size,
        [done](const boost::system::error_code &ec, const std::string &data) {
          bridge_reply reply(ec);
          if (!ec)
            reply.data = data;
          done(reply);
        });
    }

  private:
    boost::shared_ptr<stream_manager> streams;
  };

  rqbitfs_config test_config() {
    rqbitfs_config cfg;
    cfg.performance.worker_threads = 2;
    cfg.performance.read_timeout = 5;
    return cfg;
  }

  struct runtime_fixture {
    runtime_fixture()
      : sources_made(0), backends_made(0),
        runtime(test_config(), catalog,
          [this](boost::asio::io_context &ioc) -> boost::shared_ptr<range_source> {
            sources_made++;
            boost::shared_ptr<mock_range_source> source =
              boost::make_shared<mock_range_source>(boost::ref(ioc));
            source->add_file(1, 0, make_content(MOVIE_SIZE));
            return source;
          },
          [this](boost::shared_ptr<stream_manager> streams)
            -> boost::shared_ptr<bridge_backend> {
            backends_made++;
            return boost::make_shared<read_only_backend>(streams);
          }) {}

    std::atomic<int> sources_made;
    std::atomic<int> backends_made;
    movie_catalog catalog;
    mount_runtime runtime;
  };

  /* 0 when a started runtime serves a whole-file read, otherwise the step
     that failed */
  int serve_movie(mount_runtime &runtime) {
    torrent_fs *fs = runtime.start();
    if (fs == NULL)
      return 1;
    if (fs->refresh_torrents())
      return 2;
    uint64_t ino = 0;
    if (fs->resolve_path("/Movie/movie.mkv", ino))
      return 3;
    uint64_t fh = 0;
    if (fs->open(ino, O_RDONLY, fh))
      return 4;
    std::string out;
    if (fs->read(fh, 0, 128 * 1024, out))
      return 5;
    if (out != make_content(MOVIE_SIZE).substr(0, 128 * 1024))
      return 6;
    fs->release(fh);
    return 0;
  }

}

TEST_CASE_METHOD(runtime_fixture, "nothing runs before start", "[runtime]")
{
  CHECK_FALSE(runtime.is_running());
  CHECK(runtime.filesystem() == NULL);
  CHECK(runtime.bridge() == NULL);
  CHECK(sources_made.load() == 0);
  CHECK(backends_made.load() == 0);
  runtime.stop();
  CHECK_FALSE(runtime.is_running());
}

TEST_CASE_METHOD(runtime_fixture, "a started runtime serves reads until stopped", "[runtime]")
{
  REQUIRE(serve_movie(runtime) == 0);
  CHECK(runtime.is_running());
  CHECK(runtime.start() == runtime.filesystem());
  CHECK(sources_made.load() == 1);
  CHECK(backends_made.load() == 1);

  runtime.stop();
  CHECK_FALSE(runtime.is_running());
  bridge_reply r = runtime.bridge()->submit(bridge_request::read_file(1, 0, 0, 10),
                                            std::chrono::seconds(1));
  CHECK(r.ec == rqbitfs_errors::worker_disconnected);
  runtime.stop();
}

TEST_CASE_METHOD(runtime_fixture, "a runtime built before a fork runs in the child", "[runtime]")
{
  /* libfuse forks to daemonize between main() building the runtime and the
     init callback starting it */
  pid_t pid = fork();
  REQUIRE(pid >= 0);
  if (pid == 0) {
    int code = serve_movie(runtime);
    runtime.stop();
    _exit(code);
  }

  int status = 0;
  REQUIRE(waitpid(pid, &status, 0) == pid);
  REQUIRE(WIFEXITED(status));
  CHECK(WEXITSTATUS(status) == 0);
  CHECK_FALSE(runtime.is_running());
}
