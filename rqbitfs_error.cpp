#include <errno.h>
#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include "rqbitfs_error.hpp"

namespace {

  struct rqbitfs_error_category : boost::system::error_category {
    const char* name() const BOOST_SYSTEM_NOEXCEPT {
      return "rqbitfs";
    }

    std::string message(int ev) const {
      static char const* msgs[] = {
        "no error",
        "not found",
        "torrent not found",
        "file not found",
        "permission denied",
        "authentication failed",
        "operation timed out",
        "connection timed out",
        "read timed out",
        "I/O error",
        "server disconnected",
        "network error",
        "service unavailable",
        "circuit breaker is open",
        "retry limit exceeded",
        "invalid argument",
        "validation error",
        "parse error",
        "not ready",
        "device busy",
        "request queue full",
        "worker disconnected",
        "is a directory",
        "not a directory",
        "read-only filesystem",
        "unexpected response from server",
        "too many open streams",
        "bad file handle",
        "too many open files",
        "already exists",
        "file too large",
        "API error",
        "too many levels of symbolic links",
      };
      if (ev < 0 || ev >= static_cast<int>(sizeof(msgs) / sizeof(msgs[0])))
        return "unknown error";
      return msgs[ev];
    }
  };

}

const boost::system::error_category& rqbitfs_category() {
  static rqbitfs_error_category category;
  return category;
}

namespace rqbitfs_errors {

  boost::system::error_code make_error_code(error_code_enum e) {
    return boost::system::error_code(e, rqbitfs_category());
  }

}

int to_errno(const boost::system::error_code &ec) {
  using namespace rqbitfs_errors;

  if (!ec)
    return 0;

  if (ec.category() == rqbitfs_category()) {
    switch (ec.value()) {
    case not_found:
    case torrent_not_found:
    case file_not_found:
      return ENOENT;
    case permission_denied:
    case auth_failed:
      return EACCES;
    case timed_out:
    case connection_timeout:
    case read_timeout:
    case service_unavailable:
    case circuit_breaker_open:
    case retry_limit_exceeded:
    case not_ready:
    case queue_full:
    case too_many_streams:
      return EAGAIN;
    case server_disconnected:
      return ENOTCONN;
    case network_error:
      return ENETUNREACH;
    case invalid_argument:
    case validation_error:
      return EINVAL;
    case device_busy:
      return EBUSY;
    case is_directory:
      return EISDIR;
    case not_directory:
      return ENOTDIR;
    case read_only_filesystem:
      return EROFS;
    case bad_file_handle:
      return EBADF;
    case too_many_open_files:
      return EMFILE;
    case already_exists:
      return EEXIST;
    case file_too_large:
      return EFBIG;
    case symlink_loop:
      return ELOOP;
    default:
      return EIO;
    }
  }

  if (ec.category() == boost::system::generic_category())
    return ec.value();

  if (ec == boost::asio::error::connection_refused
      || ec == boost::asio::error::network_unreachable
      || ec == boost::asio::error::host_unreachable
      || ec == boost::asio::error::host_not_found)
    return ENETUNREACH;

  /* A transport failure mid-stream is worth retrying with a fresh stream */
  if (ec == boost::beast::error::timeout
      || ec == boost::asio::error::timed_out
      || ec == boost::asio::error::eof
      || ec == boost::asio::error::connection_reset
      || ec == boost::asio::error::connection_aborted
      || ec == boost::asio::error::broken_pipe
      || ec == boost::beast::http::error::partial_message
      || ec == boost::beast::http::error::end_of_stream)
    return EAGAIN;

  return EIO;
}

bool is_transient(const boost::system::error_code &ec) {
  if (!ec)
    return false;
  if (ec == rqbitfs_errors::server_disconnected
      || ec == rqbitfs_errors::network_error)
    return true;
  int err = to_errno(ec);
  return err == EAGAIN || err == ENETUNREACH || err == ENOTCONN;
}

rqbitfs_errors::error_code_enum error_from_http_status(int status) {
  using namespace rqbitfs_errors;
  switch (status) {
  case 400:
  case 416:
    return invalid_argument;
  case 401:
  case 403:
    return permission_denied;
  case 404:
    return not_found;
  case 408:
  case 423:
  case 429:
  case 503:
  case 504:
    return service_unavailable;
  case 409:
    return already_exists;
  case 413:
    return file_too_large;
  default:
    return api_error;
  }
}
