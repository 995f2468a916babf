// Everything a mounted filesystem runs on: the io_context and its threads,
// the stream manager, the bridge and torrent_fs. Nothing is created before
// start(), so a process that forks after constructing the runtime (libfuse
// daemonizing) starts its threads in the child.

#ifndef mount_runtime_h
#define mount_runtime_h

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/function.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "async_bridge.hpp"
#include "config.hpp"
#include "inode_namespace.hpp"
#include "range_source.hpp"
#include "stream_manager.hpp"
#include "torrent_catalog.hpp"
#include "torrent_fs.hpp"

class mount_runtime {
public:
  typedef boost::function<boost::shared_ptr<range_source>(boost::asio::io_context&)>
    source_factory;
  typedef boost::function<boost::shared_ptr<bridge_backend>(boost::shared_ptr<stream_manager>)>
    backend_factory;

  mount_runtime(const rqbitfs_config &cfg, torrent_catalog &catalog,
                source_factory make_source, backend_factory make_backend);

  ~mount_runtime();

  /* Starts the io threads, stream manager and bridge. Returns the
     filesystem they serve; calling it again returns the same one. */
  torrent_fs* start();

  /* Tears down in reverse order of start(). Safe without start(). */
  void stop();

  bool is_running() const;

  /* NULL until start() */
  torrent_fs* filesystem();

  async_bridge* bridge();

  boost::shared_ptr<stream_manager> streams();

private:
  typedef boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
    work_guard;

  rqbitfs_config cfg;
  torrent_catalog &catalog;
  source_factory make_source;
  backend_factory make_backend;

  mutable boost::mutex mtx;
  bool running;

  boost::scoped_ptr<boost::asio::io_context> ioc;
  boost::scoped_ptr<work_guard> work;
  boost::thread_group io_threads;
  boost::shared_ptr<stream_manager> stream_mgr;
  boost::shared_ptr<bridge_backend> backend;
  boost::scoped_ptr<async_bridge> request_bridge;
  inode_namespace inodes;
  boost::scoped_ptr<torrent_fs> fs;
};

#endif //mount_runtime_h
