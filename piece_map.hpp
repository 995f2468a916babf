// Maps file byte ranges onto torrent pieces with libtorrent's file_storage,
// the same way a libtorrent session lays the files of a torrent out.

#ifndef piece_map_h
#define piece_map_h

#include <stddef.h>
#include <stdint.h>
#include <libtorrent/bitfield.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/units.hpp>
#include "torrent_metadata.hpp"

namespace lt = libtorrent;

/* False when the metadata has no piece length or no files */
bool build_file_storage(const torrent_metadata &meta, lt::file_storage &fs);

lt::typed_bitfield<lt::piece_index_t> to_piece_bitfield(const piece_bitfield &haves);

/* True when every piece backing [offset, offset + size) of the file is
   downloaded */
bool check_pieces_available(const torrent_metadata &meta,
                            const piece_bitfield &haves,
                            size_t file_index, uint64_t offset, size_t size);

#endif //piece_map_h
