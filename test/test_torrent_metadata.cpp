#include <catch2/catch.hpp>

#include <string>
#include <vector>
#include "torrent_metadata.hpp"

TEST_CASE("the torrent list is parsed", "[metadata]")
{
  std::string json =
    "{\"torrents\": ["
    " {\"id\": 0, \"info_hash\": \"aa\", \"name\": \"Ubuntu\", \"output_folder\": \"/dl/ubuntu\"},"
    " {\"id\": 3, \"info_hash\": \"bb\", \"name\": \"Debian\"}"
    "]}";

  std::vector<torrent_summary> list;
  std::string error;
  REQUIRE(parse_torrent_list(json, list, error));
  REQUIRE(list.size() == 2);
  CHECK(list[0].id == 0);
  CHECK(list[0].name == "Ubuntu");
  CHECK(list[0].output_folder == "/dl/ubuntu");
  CHECK(list[1].id == 3);
  CHECK(list[1].info_hash == "bb");
  CHECK(list[1].output_folder.empty());
}

TEST_CASE("malformed torrent lists are rejected", "[metadata]")
{
  std::vector<torrent_summary> list;
  std::string error;
  CHECK_FALSE(parse_torrent_list("not json", list, error));
  CHECK_FALSE(error.empty());
  CHECK_FALSE(parse_torrent_list("[]", list, error));
  CHECK_FALSE(parse_torrent_list("{\"torrents\": 5}", list, error));
  CHECK_FALSE(parse_torrent_list("{\"torrents\": [{\"name\": \"no id\"}]}", list, error));

  REQUIRE(parse_torrent_list("{\"torrents\": []}", list, error));
  CHECK(list.empty());
}

TEST_CASE("torrent details are parsed", "[metadata]")
{
  std::string json =
    "{\"id\": 4, \"info_hash\": \"cc\", \"name\": \"Album\", \"output_folder\": \"/dl\","
    " \"piece_length\": 262144, \"files\": ["
    "  {\"name\": \"01.flac\", \"length\": 1000, \"components\": [\"01.flac\"]},"
    "  {\"name\": \"art/cover.jpg\", \"length\": 20, \"components\": [\"art\", \"cover.jpg\"],"
    "   \"included\": true}"
    "]}";

  torrent_metadata meta;
  std::string error;
  REQUIRE(parse_torrent_metadata(json, meta, error));
  CHECK(meta.id == 4);
  CHECK(meta.name == "Album");
  CHECK(meta.piece_length == 262144);
  REQUIRE(meta.files.size() == 2);
  CHECK(meta.files[0].name == "01.flac");
  CHECK(meta.files[0].length == 1000);
  REQUIRE(meta.files[1].components.size() == 2);
  CHECK(meta.files[1].components[1] == "cover.jpg");
  CHECK(meta.total_size() == 1020);
}

TEST_CASE("torrent details tolerate missing optional fields", "[metadata]")
{
  torrent_metadata meta;
  std::string error;
  REQUIRE(parse_torrent_metadata("{\"name\": \"bare\"}", meta, error));
  CHECK(meta.files.empty());
  CHECK(meta.piece_length == 0);
  CHECK(meta.total_size() == 0);

  CHECK_FALSE(parse_torrent_metadata("{\"files\": {}}", meta, error));
  CHECK_FALSE(parse_torrent_metadata("{\"files\": [{\"name\": \"x\"}]}", meta, error));
}

TEST_CASE("torrent stats are parsed and rendered", "[metadata]")
{
  std::string json =
    "{\"state\": \"live\", \"progress_bytes\": 500, \"uploaded_bytes\": 10,"
    " \"total_bytes\": 1000, \"finished\": false, \"error\": null,"
    " \"live\": {\"download_speed\": {\"mbps\": 1.5}}}";

  torrent_stats stats;
  std::string error;
  REQUIRE(parse_torrent_stats(json, stats, error));
  CHECK(stats.state == "live");
  CHECK(stats.progress_bytes == 500);
  CHECK(stats.total_bytes == 1000);
  CHECK_FALSE(stats.finished);
  CHECK(stats.error.empty());

  std::string rendered = stats.to_json();
  CHECK(rendered.find('\n') == std::string::npos);
  CHECK(rendered.find("\"state\":\"live\"") != std::string::npos);
  CHECK(rendered.find("\"progress_bytes\":500") != std::string::npos);
  CHECK(rendered.find("error") == std::string::npos);

  stats.error = "tracker down";
  CHECK(stats.to_json().find("\"error\":\"tracker down\"") != std::string::npos);
}

TEST_CASE("piece bitfields are read least significant bit first", "[metadata]")
{
  piece_bitfield bf;
  bf.bits = std::string("\x05\x01", 2);
  bf.num_pieces = 10;

  CHECK(bf.has_piece(0));
  CHECK_FALSE(bf.has_piece(1));
  CHECK(bf.has_piece(2));
  CHECK(bf.has_piece(8));
  CHECK_FALSE(bf.has_piece(9));
  CHECK_FALSE(bf.has_piece(10));
  CHECK(bf.downloaded_count() == 3);
  CHECK_FALSE(bf.is_complete());

  bf.bits = std::string("\xff\x03", 2);
  CHECK(bf.is_complete());

  /* fewer bytes than pieces: the missing ones are not downloaded */
  bf.bits = std::string("\xff", 1);
  CHECK_FALSE(bf.has_piece(8));
}
