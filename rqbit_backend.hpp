// Serves bridge requests for a mounted rqbit server. File reads go through
// the stream manager on the io_context; the remaining calls use the blocking
// API client and run on a separate pool so they never stall the io threads.

#ifndef rqbit_backend_h
#define rqbit_backend_h

#include <boost/asio/thread_pool.hpp>
#include <boost/shared_ptr.hpp>
#include "async_bridge.hpp"
#include "rqbit_client.hpp"
#include "stream_manager.hpp"

class rqbit_backend : public bridge_backend {
public:
  rqbit_backend(boost::shared_ptr<stream_manager> streams,
                boost::shared_ptr<rqbit_client> client,
                size_t api_threads);

  ~rqbit_backend();

  void handle(const bridge_request &req, reply_handler done);

  /* Waits for running API calls to finish */
  void stop();

private:
  void check_pieces(const bridge_request &req, reply_handler done);

  void forget_torrent(const bridge_request &req, reply_handler done);

  void torrent_status(const bridge_request &req, reply_handler done);

  boost::shared_ptr<stream_manager> streams;
  boost::shared_ptr<rqbit_client> client;
  boost::asio::thread_pool api_pool;
};

#endif //rqbit_backend_h
