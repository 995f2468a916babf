// Interface to whatever serves file bytes over HTTP. The stream manager only
// sees a sequence of chunks; it never talks to the network itself.

#ifndef range_source_h
#define range_source_h

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <boost/function.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/system/error_code.hpp>

/* HTTP statuses a successful open can report */
static const int RANGE_PARTIAL_CONTENT = 206;
static const int RANGE_FULL_CONTENT = 200;

class range_body {
public:
  /* Receives the next chunk. An empty chunk without error marks the end of
     the body. */
  typedef boost::function<void(const boost::system::error_code&,
                               const std::string&)> chunk_handler;

  virtual ~range_body() {}

  /* At most one read may be outstanding at a time */
  virtual void async_read_chunk(chunk_handler handler) = 0;

  virtual void close() = 0;
};

class range_source {
public:
  /* status is RANGE_PARTIAL_CONTENT when the server honoured the range and
     RANGE_FULL_CONTENT when it sent the whole file from byte 0 */
  typedef boost::function<void(const boost::system::error_code&, int status,
                               boost::shared_ptr<range_body>)> open_handler;

  virtual ~range_source() {}

  virtual void async_open(uint64_t torrent_id, size_t file_index,
                          uint64_t start_offset, open_handler handler) = 0;
};

#endif //range_source_h
