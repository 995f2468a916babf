// Streams file contents from rqbit's /torrents/{id}/stream/{file} endpoint
// with Boost.Beast. Each opened body owns its own connection.

#ifndef http_range_source_h
#define http_range_source_h

#include <chrono>
#include <string>
#include <boost/asio/io_context.hpp>
#include "http_util.hpp"
#include "range_source.hpp"

class http_range_source : public range_source {
public:
  http_range_source(boost::asio::io_context &ioc, const http_endpoint &endpoint,
                    const std::string &username, const std::string &password,
                    std::chrono::seconds connect_timeout = std::chrono::seconds(30),
                    std::chrono::seconds read_timeout = std::chrono::seconds(120));

  void async_open(uint64_t torrent_id, size_t file_index,
                  uint64_t start_offset, open_handler handler);

private:
  boost::asio::io_context &ioc;
  http_endpoint endpoint;
  /* empty when no credentials are configured */
  std::string auth_header;
  std::chrono::seconds connect_timeout;
  std::chrono::seconds read_timeout;
};

#endif //http_range_source_h
