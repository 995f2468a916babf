#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/peer_request.hpp>
#include "logger.hpp"
#include "piece_map.hpp"

bool build_file_storage(const torrent_metadata &meta, lt::file_storage &fs) {
  if (meta.piece_length == 0 || meta.files.empty())
    return false;

  std::string root = meta.name.empty() ? "torrent" : meta.name;
  fs.set_piece_length(static_cast<int>(meta.piece_length));
  for (size_t i = 0; i < meta.files.size(); i++) {
    const torrent_file_entry &f = meta.files[i];
    std::string rel = f.components.empty() ? f.name
      : boost::algorithm::join(f.components, "/");
    /* a single file torrent has no directory of its own */
    std::string path = meta.files.size() == 1 ? rel : root + "/" + rel;

    lt::error_code ec;
    fs.add_file(ec, path, static_cast<std::int64_t>(f.length));
    if (ec) {
      logger::log(LOG_WARN, "torrent " + boost::lexical_cast<std::string>(meta.id)
                  + ": cannot lay out " + path + ": " + ec.message());
      return false;
    }
  }

  std::int64_t total = fs.total_size();
  fs.set_num_pieces(static_cast<int>((total + meta.piece_length - 1) / meta.piece_length));
  return true;
}

lt::typed_bitfield<lt::piece_index_t> to_piece_bitfield(const piece_bitfield &haves) {
  lt::typed_bitfield<lt::piece_index_t> bf(static_cast<int>(haves.num_pieces), false);
  for (size_t i = 0; i < haves.num_pieces; i++)
    if (haves.has_piece(i))
      bf.set_bit(lt::piece_index_t(static_cast<int>(i)));
  return bf;
}

bool check_pieces_available(const torrent_metadata &meta,
                            const piece_bitfield &haves,
                            size_t file_index, uint64_t offset, size_t size) {
  if (size == 0)
    return true;
  if (meta.piece_length == 0 || file_index >= meta.files.size())
    return false;

  uint64_t file_size = meta.files[file_index].length;
  if (offset >= file_size)
    return true;
  size = static_cast<size_t>(std::min<uint64_t>(size, file_size - offset));

  lt::file_storage fs;
  if (!build_file_storage(meta, fs))
    return false;
  lt::typed_bitfield<lt::piece_index_t> have = to_piece_bitfield(haves);

  lt::file_index_t const idx(static_cast<int>(file_index));
  uint64_t cur = offset;
  uint64_t remaining = size;
  while (remaining > 0) {
    lt::peer_request pr = fs.map_file(idx, static_cast<std::int64_t>(cur),
                                      static_cast<int>(remaining));
    if (pr.piece < lt::piece_index_t(0) || pr.piece >= have.end_index()
        || !have.get_bit(pr.piece))
      return false;

    uint64_t in_piece = static_cast<uint64_t>(fs.piece_size(pr.piece) - pr.start);
    uint64_t step = std::min(in_piece, remaining);
    cur += step;
    remaining -= step;
  }
  return true;
}
