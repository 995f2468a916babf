// Blocking client for the rqbit HTTP API. Every call retries transient
// failures, and a circuit breaker keeps a dead server from being hammered.
// Calls block the calling thread; keep them off FUSE threads.

#ifndef rqbit_client_h
#define rqbit_client_h

#include <stdint.h>
#include <chrono>
#include <string>
#include <boost/thread/mutex.hpp>
#include "circuit_breaker.hpp"
#include "http_util.hpp"
#include "torrent_catalog.hpp"
#include "torrent_metadata.hpp"
#include "ttl_cache.hpp"

struct http_result {
  int status;
  std::string body;
  /* value of x-bitfield-len, empty if absent */
  std::string bitfield_len;

  http_result() : status(0) {}
};

struct rqbit_client_options {
  std::string username;
  std::string password;
  unsigned max_retries;
  std::chrono::milliseconds retry_delay;
  std::chrono::seconds request_timeout;
  std::chrono::seconds metadata_ttl;
  size_t max_cache_entries;
  std::chrono::seconds list_cache_ttl;
  std::chrono::seconds bitfield_cache_ttl;

  rqbit_client_options()
    : max_retries(3), retry_delay(500), request_timeout(60), metadata_ttl(60),
      max_cache_entries(1000), list_cache_ttl(30), bitfield_cache_ttl(5) {}
};

class rqbit_client : public torrent_catalog {
public:
  rqbit_client(const http_endpoint &endpoint,
               const rqbit_client_options &options = rqbit_client_options());

  /* Lists all torrents with their details. Torrents whose details cannot be
     fetched end up in `out.errors`; only a failing list call is an error. */
  boost::system::error_code list_torrents(torrent_list_result &out);

  boost::system::error_code get_torrent(uint64_t id, torrent_metadata &out);

  boost::system::error_code get_torrent_stats(uint64_t id, torrent_stats &out);

  boost::system::error_code get_piece_bitfield(uint64_t id, piece_bitfield &out);

  /* Removes the torrent from rqbit, keeping its files */
  boost::system::error_code forget_torrent(uint64_t id);

  bool health_check();

  /* Polls health_check with exponential back-off until the server answers
     or `max_wait` passes */
  boost::system::error_code wait_for_server(std::chrono::seconds max_wait);

  void invalidate_list_cache();

  circuit_state breaker_state() const { return breaker.state(); }

private:
  boost::system::error_code perform(const std::string &method,
                                    const std::string &path,
                                    http_result &out,
                                    std::chrono::seconds timeout);

  boost::system::error_code execute_with_retry(const std::string &method,
                                               const std::string &path,
                                               http_result &out);

  /* execute_with_retry plus mapping of non-2xx statuses onto errors */
  boost::system::error_code call(const std::string &method,
                                 const std::string &path, http_result &out);

  boost::system::error_code torrent_action(uint64_t id, const std::string &action);

  http_endpoint endpoint;
  rqbit_client_options options;
  std::string auth_header;
  mutable circuit_breaker breaker;

  ttl_cache<uint64_t, torrent_metadata> metadata_cache;
  ttl_cache<uint64_t, piece_bitfield> bitfield_cache;

  boost::mutex list_mtx;
  bool list_cached;
  std::chrono::steady_clock::time_point list_cached_at;
  torrent_list_result list_cache;
};

#endif //rqbit_client_h
