#include <algorithm>
#include <thread>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/lexical_cast.hpp>
#include "logger.hpp"
#include "rqbit_client.hpp"
#include "rqbitfs_error.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

/* JSON answers larger than this are treated as broken */
static const uint64_t MAX_RESPONSE_BODY = 64 * 1024 * 1024;

static std::string to_string(uint64_t v) {
  return boost::lexical_cast<std::string>(v);
}

rqbit_client::rqbit_client(const http_endpoint &endpoint,
                           const rqbit_client_options &options)
  : endpoint(endpoint), options(options),
    metadata_cache(options.metadata_ttl, options.max_cache_entries),
    bitfield_cache(options.bitfield_cache_ttl, options.max_cache_entries),
    list_cached(false) {
  if (!options.username.empty() || !options.password.empty())
    auth_header = basic_auth_header(options.username, options.password);
}

boost::system::error_code rqbit_client::perform(const std::string &method,
                                                const std::string &path,
                                                http_result &out,
                                                std::chrono::seconds timeout) {
  http::request<http::string_body> req;
  req.method(method == "POST" ? http::verb::post : http::verb::get);
  req.target(endpoint.base_path + path);
  req.version(11);
  req.set(http::field::host, endpoint.host);
  req.set(http::field::user_agent, "rqbitfs");
  if (!auth_header.empty())
    req.set(http::field::authorization, auth_header);
  req.prepare_payload();

  /* a private io_context lets the blocking call still honour timeouts */
  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(MAX_RESPONSE_BODY);
  boost::system::error_code result;

  resolver.async_resolve(endpoint.host, endpoint.port,
    [&](const boost::system::error_code &ec, tcp::resolver::results_type results) {
      if (ec) {
        result = ec;
        return;
      }
      stream.expires_after(timeout);
      stream.async_connect(results,
        [&](const boost::system::error_code &ec, tcp::endpoint) {
          if (ec) {
            result = ec;
            return;
          }
          http::async_write(stream, req,
            [&](const boost::system::error_code &ec, std::size_t) {
              if (ec) {
                result = ec;
                return;
              }
              http::async_read(stream, buffer, parser,
                [&](const boost::system::error_code &ec, std::size_t) {
                  result = ec;
                });
            });
        });
    });
  ioc.run();

  boost::system::error_code ignored;
  stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

  if (result)
    return result;

  out.status = static_cast<int>(parser.get().result_int());
  out.body = parser.get().body();
  http::response<http::string_body>::const_iterator it =
    parser.get().find("x-bitfield-len");
  if (it != parser.get().end())
    out.bitfield_len = std::string(it->value().data(), it->value().size());
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::execute_with_retry(const std::string &method,
                                                           const std::string &path,
                                                           http_result &out) {
  if (!breaker.can_execute()) {
    logger::log(LOG_DEBUG, method + " " + path + ": circuit breaker open");
    return rqbitfs_errors::circuit_breaker_open;
  }

  boost::system::error_code ec;
  for (unsigned attempt = 0; attempt <= options.max_retries; attempt++) {
    out = http_result();
    ec = perform(method, path, out, options.request_timeout);
    bool last = attempt == options.max_retries;

    if (!ec && out.status >= 500 && !last) {
      logger::log(LOG_WARN, method + " " + path + ": server error "
                  + to_string(out.status) + ", retrying (attempt "
                  + to_string(attempt + 1) + "/" + to_string(options.max_retries + 1) + ")");
    } else if (ec && is_transient(ec) && !last) {
      logger::log(LOG_WARN, method + " " + path + ": " + ec.message()
                  + ", retrying (attempt " + to_string(attempt + 1) + "/"
                  + to_string(options.max_retries + 1) + ")");
    } else {
      break;
    }
    std::this_thread::sleep_for(options.retry_delay * (attempt + 1));
  }

  if (!ec && out.status < 500)
    breaker.record_success();
  else if (!ec || is_transient(ec))
    breaker.record_failure();

  return ec;
}

boost::system::error_code rqbit_client::call(const std::string &method,
                                             const std::string &path,
                                             http_result &out) {
  boost::system::error_code ec = execute_with_retry(method, path, out);
  if (ec) {
    logger::log(LOG_WARN, method + " " + path + " failed: " + ec.message());
    return ec;
  }
  if (out.status < 200 || out.status >= 300) {
    logger::log(LOG_WARN, method + " " + path + " returned HTTP "
                + to_string(out.status) + ": " + out.body.substr(0, 200));
    return error_from_http_status(out.status);
  }
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::list_torrents(torrent_list_result &out) {
  {
    boost::mutex::scoped_lock lock(list_mtx);
    if (list_cached
        && std::chrono::steady_clock::now() - list_cached_at < options.list_cache_ttl) {
      logger::log(LOG_TRACE, "list_torrents: cache hit");
      out = list_cache;
      return boost::system::error_code();
    }
  }

  http_result res;
  boost::system::error_code ec = call("GET", "/torrents", res);
  if (ec)
    return ec;

  std::vector<torrent_summary> summaries;
  std::string perr;
  if (!parse_torrent_list(res.body, summaries, perr)) {
    logger::log(LOG_ERROR, "cannot parse torrent list: " + perr);
    return rqbitfs_errors::parse_error;
  }

  torrent_list_result result;
  for (size_t i = 0; i < summaries.size(); i++) {
    torrent_metadata meta;
    ec = get_torrent(summaries[i].id, meta);
    if (ec) {
      logger::log(LOG_WARN, "cannot get details of torrent "
                  + to_string(summaries[i].id) + " (" + summaries[i].name
                  + "): " + ec.message());
      torrent_list_failure failure;
      failure.id = summaries[i].id;
      failure.name = summaries[i].name;
      failure.ec = ec;
      result.errors.push_back(failure);
      continue;
    }
    result.torrents.push_back(meta);
  }

  if (result.is_partial())
    logger::log(LOG_INFO, "partial torrent list: " + to_string(result.torrents.size())
                + " succeeded, " + to_string(result.errors.size()) + " failed");

  {
    boost::mutex::scoped_lock lock(list_mtx);
    list_cache = result;
    list_cached = true;
    list_cached_at = std::chrono::steady_clock::now();
  }
  out = result;
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::get_torrent(uint64_t id,
                                                    torrent_metadata &out) {
  if (metadata_cache.get(id, out))
    return boost::system::error_code();

  http_result res;
  boost::system::error_code ec = call("GET", "/torrents/" + to_string(id), res);
  if (ec == rqbitfs_errors::not_found)
    return rqbitfs_errors::torrent_not_found;
  if (ec)
    return ec;

  torrent_metadata meta;
  std::string perr;
  if (!parse_torrent_metadata(res.body, meta, perr)) {
    logger::log(LOG_ERROR, "cannot parse torrent " + to_string(id) + ": " + perr);
    return rqbitfs_errors::parse_error;
  }
  meta.id = id;
  metadata_cache.put(id, meta);
  out = meta;
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::get_torrent_stats(uint64_t id,
                                                          torrent_stats &out) {
  http_result res;
  boost::system::error_code ec =
    call("GET", "/torrents/" + to_string(id) + "/stats/v1", res);
  if (ec == rqbitfs_errors::not_found)
    return rqbitfs_errors::torrent_not_found;
  if (ec)
    return ec;

  std::string perr;
  if (!parse_torrent_stats(res.body, out, perr)) {
    logger::log(LOG_ERROR, "cannot parse stats of torrent " + to_string(id) + ": " + perr);
    return rqbitfs_errors::parse_error;
  }
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::get_piece_bitfield(uint64_t id,
                                                           piece_bitfield &out) {
  if (bitfield_cache.get(id, out))
    return boost::system::error_code();

  http_result res;
  boost::system::error_code ec =
    call("GET", "/torrents/" + to_string(id) + "/haves", res);
  if (ec == rqbitfs_errors::not_found)
    return rqbitfs_errors::torrent_not_found;
  if (ec)
    return ec;

  piece_bitfield bf;
  bf.bits = res.body;
  bf.num_pieces = res.body.size() * 8;
  if (!res.bitfield_len.empty()) {
    try {
      bf.num_pieces = boost::lexical_cast<size_t>(res.bitfield_len);
    } catch (const boost::bad_lexical_cast &) {
      logger::log(LOG_WARN, "torrent " + to_string(id)
                  + ": bad x-bitfield-len " + res.bitfield_len);
      return rqbitfs_errors::protocol_violation;
    }
  }
  bitfield_cache.put(id, bf);
  out = bf;
  return boost::system::error_code();
}

boost::system::error_code rqbit_client::torrent_action(uint64_t id,
                                                       const std::string &action) {
  http_result res;
  boost::system::error_code ec =
    call("POST", "/torrents/" + to_string(id) + "/" + action, res);
  if (ec == rqbitfs_errors::not_found)
    return rqbitfs_errors::torrent_not_found;
  return ec;
}

boost::system::error_code rqbit_client::forget_torrent(uint64_t id) {
  boost::system::error_code ec = torrent_action(id, "forget");
  if (!ec) {
    metadata_cache.remove(id);
    bitfield_cache.remove(id);
    invalidate_list_cache();
    logger::log(LOG_INFO, "forgot torrent " + to_string(id));
  }
  return ec;
}

bool rqbit_client::health_check() {
  http_result res;
  boost::system::error_code ec =
    perform("GET", "/torrents", res, std::chrono::seconds(5));
  if (!ec && res.status >= 200 && res.status < 300) {
    breaker.record_success();
    return true;
  }
  if (ec) {
    if (is_transient(ec))
      breaker.record_failure();
    logger::log(LOG_WARN, "health check failed: " + ec.message());
  } else {
    breaker.record_failure();
    logger::log(LOG_WARN, "health check returned HTTP " + to_string(res.status));
  }
  return false;
}

boost::system::error_code rqbit_client::wait_for_server(std::chrono::seconds max_wait) {
  std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
  unsigned attempt = 0;
  while (std::chrono::steady_clock::now() - start < max_wait) {
    if (health_check()) {
      logger::log(LOG_DEBUG, "server is available");
      return boost::system::error_code();
    }
    attempt++;
    std::chrono::milliseconds delay(500LL << std::min(attempt, 5u));
    logger::log(LOG_DEBUG, "server not ready, retry " + to_string(attempt)
                + " in " + to_string(delay.count()) + "ms");
    std::this_thread::sleep_for(delay);
  }
  return rqbitfs_errors::server_disconnected;
}

void rqbit_client::invalidate_list_cache() {
  boost::mutex::scoped_lock lock(list_mtx);
  list_cached = false;
}
