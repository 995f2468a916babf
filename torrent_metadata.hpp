// Torrent descriptions as reported by the rqbit HTTP API, and the JSON
// parsing that produces them.

#ifndef torrent_metadata_h
#define torrent_metadata_h

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

/* One entry of GET /torrents */
struct torrent_summary {
  uint64_t id;
  std::string info_hash;
  std::string name;
  std::string output_folder;

  torrent_summary() : id(0) {}
};

struct torrent_file_entry {
  /* full relative path as rqbit prints it */
  std::string name;

  /* size of the file in bytes */
  uint64_t length;

  /* path split into its components */
  std::vector<std::string> components;

  torrent_file_entry() : length(0) {}
};

/* GET /torrents/{id} */
class torrent_metadata {
public:
  uint64_t id;
  std::string info_hash;
  std::string name;
  std::string output_folder;
  std::vector<torrent_file_entry> files;

  /* 0 when the server does not report it */
  uint64_t piece_length;

  torrent_metadata() : id(0), piece_length(0) {}

  uint64_t total_size() const;
};

/* GET /torrents/{id}/stats/v1 */
struct torrent_stats {
  std::string state;
  uint64_t progress_bytes;
  uint64_t uploaded_bytes;
  uint64_t total_bytes;
  bool finished;
  std::string error;

  torrent_stats()
    : progress_bytes(0), uploaded_bytes(0), total_bytes(0), finished(false) {}

  /* Single line JSON, as exposed through the status xattr */
  std::string to_json() const;
};

/* GET /torrents/{id}/haves. Bit i of the bitfield is bit (i % 8) of byte
   (i / 8), least significant bit first. */
struct piece_bitfield {
  std::string bits;
  size_t num_pieces;

  piece_bitfield() : num_pieces(0) {}

  bool has_piece(size_t piece) const;

  size_t downloaded_count() const;

  bool is_complete() const;
};

/* Each returns false and fills `error` when the document does not have the
   expected shape */
bool parse_torrent_list(const std::string &json,
                        std::vector<torrent_summary> &out, std::string &error);

bool parse_torrent_metadata(const std::string &json, torrent_metadata &out,
                            std::string &error);

bool parse_torrent_stats(const std::string &json, torrent_stats &out,
                         std::string &error);

#endif /*torrent_metadata_h*/
