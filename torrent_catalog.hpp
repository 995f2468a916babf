#ifndef torrent_catalog_h
#define torrent_catalog_h

#include <stdint.h>
#include <string>
#include <vector>
#include <boost/system/error_code.hpp>
#include "torrent_metadata.hpp"

struct torrent_list_failure {
  uint64_t id;
  std::string name;
  boost::system::error_code ec;
};

/* Torrents whose details could be fetched, plus the ones that failed */
struct torrent_list_result {
  std::vector<torrent_metadata> torrents;
  std::vector<torrent_list_failure> errors;

  bool is_partial() const { return !errors.empty(); }
};

/* Source of the torrent list used to build the mounted tree */
class torrent_catalog {
public:
  virtual ~torrent_catalog() {}

  virtual boost::system::error_code list_torrents(torrent_list_result &out) = 0;
};

#endif //torrent_catalog_h
