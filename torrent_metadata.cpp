#include <memory>
#include <json/json.h>
#include "torrent_metadata.hpp"

namespace {

  bool parse_document(const std::string &json, Json::Value &root,
                      std::string &error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &error))
      return false;
    if (!root.isObject()) {
      error = "expected a JSON object";
      return false;
    }
    return true;
  }

  uint64_t get_uint(const Json::Value &obj, const char *key) {
    const Json::Value &v = obj[key];
    return v.isUInt64() ? v.asUInt64() : 0;
  }

  std::string get_string(const Json::Value &obj, const char *key) {
    const Json::Value &v = obj[key];
    return v.isString() ? v.asString() : std::string();
  }

}

uint64_t torrent_metadata::total_size() const {
  uint64_t total = 0;
  for (size_t i = 0; i < files.size(); i++)
    total += files[i].length;
  return total;
}

std::string torrent_stats::to_json() const {
  Json::Value v;
  v["state"] = state;
  v["progress_bytes"] = Json::UInt64(progress_bytes);
  v["uploaded_bytes"] = Json::UInt64(uploaded_bytes);
  v["total_bytes"] = Json::UInt64(total_bytes);
  v["finished"] = finished;
  if (!error.empty())
    v["error"] = error;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, v);
}

bool piece_bitfield::has_piece(size_t piece) const {
  if (piece >= num_pieces)
    return false;
  size_t byte = piece / 8;
  if (byte >= bits.size())
    return false;
  return (static_cast<unsigned char>(bits[byte]) >> (piece % 8)) & 1;
}

size_t piece_bitfield::downloaded_count() const {
  size_t n = 0;
  for (size_t i = 0; i < num_pieces; i++) {
    if (has_piece(i))
      n++;
  }
  return n;
}

bool piece_bitfield::is_complete() const {
  return downloaded_count() == num_pieces;
}

bool parse_torrent_list(const std::string &json,
                        std::vector<torrent_summary> &out, std::string &error) {
  Json::Value root;
  if (!parse_document(json, root, error))
    return false;

  const Json::Value &list = root["torrents"];
  if (!list.isArray()) {
    error = "missing torrents array";
    return false;
  }

  out.clear();
  for (Json::ArrayIndex i = 0; i < list.size(); i++) {
    const Json::Value &t = list[i];
    if (!t.isObject() || !t["id"].isUInt64()) {
      error = "torrent entry without an id";
      return false;
    }
    torrent_summary s;
    s.id = t["id"].asUInt64();
    s.info_hash = get_string(t, "info_hash");
    s.name = get_string(t, "name");
    s.output_folder = get_string(t, "output_folder");
    out.push_back(s);
  }
  return true;
}

bool parse_torrent_metadata(const std::string &json, torrent_metadata &out,
                            std::string &error) {
  Json::Value root;
  if (!parse_document(json, root, error))
    return false;

  const Json::Value &files = root["files"];
  if (!files.isNull() && !files.isArray()) {
    error = "files is not an array";
    return false;
  }

  if (root["id"].isUInt64())
    out.id = root["id"].asUInt64();
  out.info_hash = get_string(root, "info_hash");
  out.name = get_string(root, "name");
  out.output_folder = get_string(root, "output_folder");
  out.piece_length = get_uint(root, "piece_length");

  out.files.clear();
  for (Json::ArrayIndex i = 0; i < files.size(); i++) {
    const Json::Value &f = files[i];
    if (!f.isObject() || !f["length"].isUInt64()) {
      error = "file entry without a length";
      return false;
    }
    torrent_file_entry e;
    e.name = get_string(f, "name");
    e.length = f["length"].asUInt64();
    const Json::Value &components = f["components"];
    if (components.isArray()) {
      for (Json::ArrayIndex j = 0; j < components.size(); j++) {
        if (components[j].isString())
          e.components.push_back(components[j].asString());
      }
    }
    out.files.push_back(e);
  }
  return true;
}

bool parse_torrent_stats(const std::string &json, torrent_stats &out,
                         std::string &error) {
  Json::Value root;
  if (!parse_document(json, root, error))
    return false;

  out.state = get_string(root, "state");
  out.progress_bytes = get_uint(root, "progress_bytes");
  out.uploaded_bytes = get_uint(root, "uploaded_bytes");
  out.total_bytes = get_uint(root, "total_bytes");
  out.finished = root["finished"].isBool() && root["finished"].asBool();
  out.error = get_string(root, "error");
  return true;
}
