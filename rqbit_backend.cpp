#include <boost/asio/post.hpp>
#include <boost/lexical_cast.hpp>
#include "logger.hpp"
#include "piece_map.hpp"
#include "rqbit_backend.hpp"
#include "rqbitfs_error.hpp"

rqbit_backend::rqbit_backend(boost::shared_ptr<stream_manager> streams,
                             boost::shared_ptr<rqbit_client> client,
                             size_t api_threads)
  : streams(streams), client(client), api_pool(api_threads) {
}

rqbit_backend::~rqbit_backend() {
  stop();
}

void rqbit_backend::stop() {
  api_pool.join();
}

void rqbit_backend::handle(const bridge_request &req, reply_handler done) {
  switch (req.kind) {
  case REQUEST_READ_FILE:
    streams->async_read(req.torrent_id, req.file_index, req.offset, req.size,
      [done](const boost::system::error_code &ec, const std::string &data) {
        bridge_reply reply(ec);
        if (!ec)
          reply.data = data;
        done(reply);
      });
    break;
  case REQUEST_CHECK_PIECES:
    boost::asio::post(api_pool, [this, req, done]() { check_pieces(req, done); });
    break;
  case REQUEST_FORGET_TORRENT:
    boost::asio::post(api_pool, [this, req, done]() { forget_torrent(req, done); });
    break;
  case REQUEST_TORRENT_STATUS:
    boost::asio::post(api_pool, [this, req, done]() { torrent_status(req, done); });
    break;
  default:
    done(bridge_reply(rqbitfs_errors::invalid_argument));
  }
}

void rqbit_backend::check_pieces(const bridge_request &req, reply_handler done) {
  torrent_metadata meta;
  boost::system::error_code ec = client->get_torrent(req.torrent_id, meta);
  if (ec) {
    done(bridge_reply(ec));
    return;
  }
  piece_bitfield haves;
  ec = client->get_piece_bitfield(req.torrent_id, haves);
  if (ec) {
    done(bridge_reply(ec));
    return;
  }

  bridge_reply reply;
  reply.available = check_pieces_available(meta, haves, req.file_index,
                                           req.offset, req.size);
  done(reply);
}

void rqbit_backend::forget_torrent(const bridge_request &req, reply_handler done) {
  boost::system::error_code ec = client->forget_torrent(req.torrent_id);
  if (!ec)
    streams->close_torrent_streams(req.torrent_id);
  done(bridge_reply(ec));
}

void rqbit_backend::torrent_status(const bridge_request &req, reply_handler done) {
  torrent_stats stats;
  boost::system::error_code ec = client->get_torrent_stats(req.torrent_id, stats);
  if (ec) {
    logger::log(LOG_DEBUG, "status of torrent "
                + boost::lexical_cast<std::string>(req.torrent_id)
                + " unavailable: " + ec.message());
    done(bridge_reply(ec));
    return;
  }
  bridge_reply reply;
  reply.data = stats.to_json();
  done(reply);
}
