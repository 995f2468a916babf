#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/ref.hpp>
#include "logger.hpp"
#include "mount_runtime.hpp"

mount_runtime::mount_runtime(const rqbitfs_config &cfg, torrent_catalog &catalog,
                             source_factory make_source, backend_factory make_backend)
  : cfg(cfg), catalog(catalog), make_source(make_source),
    make_backend(make_backend), running(false) {
}

mount_runtime::~mount_runtime() {
  stop();
}

torrent_fs* mount_runtime::start() {
  boost::mutex::scoped_lock lock(mtx);
  if (fs)
    return fs.get();

  const performance_config &perf = cfg.performance;
  ioc.reset(new boost::asio::io_context());
  work.reset(new work_guard(boost::asio::make_work_guard(*ioc)));
  boost::asio::io_context *io = ioc.get();
  for (int i = 0; i < perf.worker_threads; i++)
    io_threads.create_thread([io]() { io->run(); });

  stream_mgr = boost::make_shared<stream_manager>(
    boost::ref(*ioc), make_source(*ioc), perf.stream_seek_threshold,
    std::chrono::seconds(perf.stream_idle_timeout), perf.max_streams);
  stream_mgr->start();

  backend = make_backend(stream_mgr);
  request_bridge.reset(new async_bridge(*ioc, backend, perf.request_queue_capacity));
  request_bridge->start();

  torrent_fs_options fs_options;
  fs_options.read_timeout = std::chrono::seconds(perf.read_timeout);
  fs_options.max_open_files = perf.max_open_files;
  fs_options.check_pieces_before_read = perf.check_pieces_before_read;
  fs.reset(new torrent_fs(inodes, *request_bridge, catalog, fs_options));
  boost::shared_ptr<stream_manager> s = stream_mgr;
  fs->set_torrent_removed_handler([s](uint64_t id) { s->close_torrent_streams(id); });

  running = true;
  logger::log(LOG_INFO, "runtime started with "
              + boost::lexical_cast<std::string>(perf.worker_threads) + " io threads");
  return fs.get();
}

void mount_runtime::stop() {
  boost::mutex::scoped_lock lock(mtx);
  if (!running)
    return;
  running = false;

  fs->stop_discovery();
  request_bridge->shutdown();
  stream_mgr->stop();
  backend->stop();
  work.reset();
  ioc->stop();
  io_threads.join_all();
  logger::log(LOG_INFO, "runtime stopped");
}

bool mount_runtime::is_running() const {
  boost::mutex::scoped_lock lock(mtx);
  return running;
}

torrent_fs* mount_runtime::filesystem() {
  boost::mutex::scoped_lock lock(mtx);
  return fs.get();
}

async_bridge* mount_runtime::bridge() {
  boost::mutex::scoped_lock lock(mtx);
  return request_bridge.get();
}

boost::shared_ptr<stream_manager> mount_runtime::streams() {
  boost::mutex::scoped_lock lock(mtx);
  return stream_mgr;
}
