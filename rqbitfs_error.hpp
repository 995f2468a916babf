// Error codes reported by rqbitfs components. They live in their own
// boost::system category so they travel through the same error_code as
// asio and beast failures, and are mapped to errno only at the FUSE edge.

#ifndef rqbitfs_error_h
#define rqbitfs_error_h

#include <string>
#include <boost/system/error_code.hpp>

namespace rqbitfs_errors {

  enum error_code_enum {
    no_error = 0,
    not_found,
    torrent_not_found,
    file_not_found,
    permission_denied,
    auth_failed,
    timed_out,
    connection_timeout,
    read_timeout,
    io_error,
    server_disconnected,
    network_error,
    service_unavailable,
    circuit_breaker_open,
    retry_limit_exceeded,
    invalid_argument,
    validation_error,
    parse_error,
    not_ready,
    device_busy,
    queue_full,
    worker_disconnected,
    is_directory,
    not_directory,
    read_only_filesystem,
    protocol_violation,
    too_many_streams,
    bad_file_handle,
    too_many_open_files,
    already_exists,
    file_too_large,
    api_error,
    symlink_loop,

    error_code_max
  };

  boost::system::error_code make_error_code(error_code_enum e);

}

namespace boost { namespace system {
  template<> struct is_error_code_enum<rqbitfs_errors::error_code_enum>
  { static const bool value = true; };
} }

const boost::system::error_category& rqbitfs_category();

/* errno value (positive) to hand back to the kernel for this failure */
int to_errno(const boost::system::error_code &ec);

/* True when retrying the same operation later may succeed */
bool is_transient(const boost::system::error_code &ec);

/* Classifies a non-2xx HTTP status */
rqbitfs_errors::error_code_enum error_from_http_status(int status);

#endif //rqbitfs_error_h
