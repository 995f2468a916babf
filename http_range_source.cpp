#include <limits>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/optional.hpp>
#include "http_range_source.hpp"
#include "logger.hpp"
#include "rqbitfs_error.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

static const size_t STREAM_CHUNK_SIZE = 64 * 1024;

namespace {

  class http_range_body
    : public range_body, public boost::enable_shared_from_this<http_range_body> {
  public:
    http_range_body(boost::asio::io_context &ioc,
                    std::chrono::seconds connect_timeout,
                    std::chrono::seconds read_timeout)
      : ioc(ioc), resolver(ioc), stream(ioc), connect_timeout(connect_timeout),
        read_timeout(read_timeout), closed(false) {}

    void start(const http_endpoint &endpoint, const std::string &target,
               uint64_t start_offset, const std::string &auth_header,
               range_source::open_handler handler) {
      open_done = handler;
      host = endpoint.host;
      this->target = target;

      req.method(http::verb::get);
      req.target(target);
      req.version(11);
      req.set(http::field::host, endpoint.host);
      req.set(http::field::user_agent, "rqbitfs");
      req.set(http::field::range,
              "bytes=" + boost::lexical_cast<std::string>(start_offset) + "-");
      if (!auth_header.empty())
        req.set(http::field::authorization, auth_header);

      boost::shared_ptr<http_range_body> self = shared_from_this();
      resolver.async_resolve(endpoint.host, endpoint.port,
        [self](const boost::system::error_code &ec,
               tcp::resolver::results_type results) {
          self->on_resolve(ec, results);
        });
    }

    void async_read_chunk(chunk_handler handler) {
      if (closed) {
        boost::asio::post(ioc, [handler]() {
          handler(boost::asio::error::operation_aborted, std::string());
        });
        return;
      }
      if (parser->is_done()) {
        boost::asio::post(ioc, [handler]() {
          handler(boost::system::error_code(), std::string());
        });
        return;
      }

      parser->get().body().data = buf;
      parser->get().body().size = sizeof(buf);
      stream.expires_after(read_timeout);

      boost::shared_ptr<http_range_body> self = shared_from_this();
      http::async_read(stream, buffer, *parser,
        [self, handler](boost::system::error_code ec, std::size_t) {
          self->on_body(ec, handler);
        });
    }

    void close() {
      if (closed)
        return;
      closed = true;
      boost::system::error_code ignored;
      stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
      stream.socket().close(ignored);
    }

  private:
    void on_resolve(const boost::system::error_code &ec,
                    tcp::resolver::results_type results) {
      if (ec)
        return fail(ec, "resolve");
      stream.expires_after(connect_timeout);
      boost::shared_ptr<http_range_body> self = shared_from_this();
      stream.async_connect(results,
        [self](const boost::system::error_code &ec,
               tcp::resolver::results_type::endpoint_type) {
          self->on_connect(ec);
        });
    }

    void on_connect(const boost::system::error_code &ec) {
      if (ec)
        return fail(ec, "connect");
      stream.expires_after(read_timeout);
      boost::shared_ptr<http_range_body> self = shared_from_this();
      http::async_write(stream, req,
        [self](const boost::system::error_code &ec, std::size_t) {
          self->on_write(ec);
        });
    }

    void on_write(const boost::system::error_code &ec) {
      if (ec)
        return fail(ec, "write");
      parser.emplace();
      parser->body_limit(std::numeric_limits<uint64_t>::max());
      boost::shared_ptr<http_range_body> self = shared_from_this();
      http::async_read_header(stream, buffer, *parser,
        [self](const boost::system::error_code &ec, std::size_t) {
          self->on_header(ec);
        });
    }

    void on_header(const boost::system::error_code &ec) {
      if (ec)
        return fail(ec, "read header");

      int status = static_cast<int>(parser->get().result_int());
      if (status != RANGE_PARTIAL_CONTENT && status != RANGE_FULL_CONTENT) {
        logger::log(LOG_WARN, "GET " + target
                    + " returned HTTP " + boost::lexical_cast<std::string>(status));
        close();
        boost::system::error_code err;
        if (status >= 200 && status < 300)
          err = rqbitfs_errors::protocol_violation;
        else
          err = error_from_http_status(status);
        return finish_open(err, 0);
      }
      finish_open(boost::system::error_code(), status);
    }

    void on_body(boost::system::error_code ec, chunk_handler handler) {
      if (ec == http::error::need_buffer)
        ec = boost::system::error_code();
      if (ec) {
        handler(ec, std::string());
        return;
      }

      size_t got = sizeof(buf) - parser->get().body().size;
      if (got == 0 && !parser->is_done()) {
        /* only framing was consumed, ask for more */
        async_read_chunk(handler);
        return;
      }
      handler(boost::system::error_code(), std::string(buf, got));
    }

    void fail(const boost::system::error_code &ec, const char *what) {
      logger::log(LOG_WARN, std::string("stream ") + what + " failed for "
                  + host + ": " + ec.message());
      close();
      finish_open(ec, 0);
    }

    void finish_open(const boost::system::error_code &ec, int status) {
      range_source::open_handler handler = open_done;
      open_done.clear();
      if (ec)
        handler(ec, 0, boost::shared_ptr<range_body>());
      else
        handler(ec, status, shared_from_this());
    }

    boost::asio::io_context &ioc;
    tcp::resolver resolver;
    beast::tcp_stream stream;
    beast::flat_buffer buffer;
    http::request<http::empty_body> req;
    boost::optional<http::response_parser<http::buffer_body> > parser;
    char buf[STREAM_CHUNK_SIZE];
    std::chrono::seconds connect_timeout;
    std::chrono::seconds read_timeout;
    range_source::open_handler open_done;
    std::string host;
    std::string target;
    bool closed;
  };

}

http_range_source::http_range_source(boost::asio::io_context &ioc,
                                     const http_endpoint &endpoint,
                                     const std::string &username,
                                     const std::string &password,
                                     std::chrono::seconds connect_timeout,
                                     std::chrono::seconds read_timeout)
  : ioc(ioc), endpoint(endpoint), connect_timeout(connect_timeout),
    read_timeout(read_timeout) {
  if (!username.empty() || !password.empty())
    auth_header = basic_auth_header(username, password);
}

void http_range_source::async_open(uint64_t torrent_id, size_t file_index,
                                   uint64_t start_offset, open_handler handler) {
  std::string target = endpoint.base_path + "/torrents/"
    + boost::lexical_cast<std::string>(torrent_id) + "/stream/"
    + boost::lexical_cast<std::string>(file_index);

  logger::log(LOG_DEBUG, "opening stream " + target + " at "
              + boost::lexical_cast<std::string>(start_offset));

  boost::shared_ptr<http_range_body> body =
    boost::make_shared<http_range_body>(ioc, connect_timeout, read_timeout);
  body->start(endpoint, target, start_offset, auth_header, handler);
}
