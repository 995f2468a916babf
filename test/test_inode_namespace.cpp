#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <set>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "inode_namespace.hpp"

TEST_CASE("the root exists from the start", "[inode]")
{
  inode_namespace inodes;
  inode_entry root;
  REQUIRE(inodes.lookup_by_inode(inode_namespace::ROOT_INODE, root));
  CHECK(root.is_directory());
  CHECK(inodes.lookup_by_path("/") == inode_namespace::ROOT_INODE);
  CHECK(inodes.get_path(inode_namespace::ROOT_INODE) == "/");
  CHECK(inodes.size() == 1);
  CHECK(inodes.children_of(inode_namespace::ROOT_INODE).empty());
}

TEST_CASE("allocated entries are reachable by every index", "[inode]")
{
  inode_namespace inodes;
  uint64_t dir = inodes.allocate_torrent_directory(7, "Ubuntu");
  REQUIRE(dir > inode_namespace::ROOT_INODE);
  uint64_t sub = inodes.allocate_directory("isos", dir, 7);
  uint64_t file = inodes.allocate_file("disk.iso", sub, 7, 3, 123456);
  uint64_t link = inodes.allocate_symlink("latest", inode_namespace::ROOT_INODE,
                                          "Ubuntu/isos/disk.iso");
  REQUIRE(sub != 0);
  REQUIRE(file != 0);
  REQUIRE(link != 0);

  CHECK(inodes.lookup_by_path("/Ubuntu") == dir);
  CHECK(inodes.lookup_by_path("/Ubuntu/isos/disk.iso") == file);
  CHECK(inodes.lookup_by_torrent(7) == dir);
  CHECK(inodes.get_path(file) == "/Ubuntu/isos/disk.iso");
  CHECK(inodes.get_path(link) == "/latest");

  inode_entry e;
  REQUIRE(inodes.lookup_by_inode(file, e));
  CHECK(e.is_file());
  CHECK(e.parent == sub);
  CHECK(e.torrent_id == 7);
  CHECK(e.file_index == 3);
  CHECK(e.size == 123456);

  REQUIRE(inodes.lookup_by_inode(link, e));
  CHECK(e.is_symlink());
  CHECK(e.target == "Ubuntu/isos/disk.iso");

  std::vector<uint64_t> children = inodes.children_of(inode_namespace::ROOT_INODE);
  CHECK(children.size() == 2);
  CHECK(std::count(children.begin(), children.end(), dir) == 1);
  CHECK(std::count(children.begin(), children.end(), link) == 1);
  CHECK(inodes.children_of(sub) == std::vector<uint64_t>(1, file));

  /* only torrent directories directly under the root are indexed */
  CHECK(inodes.torrent_ids() == std::vector<uint64_t>(1, 7));
  CHECK(inodes.size() == 5);
}

TEST_CASE("allocation fails under a missing or non-directory parent", "[inode]")
{
  inode_namespace inodes;
  uint64_t dir = inodes.allocate_torrent_directory(1, "t");
  uint64_t file = inodes.allocate_file("f", dir, 1, 0, 10);
  REQUIRE(file != 0);

  CHECK(inodes.allocate_file("g", file, 1, 1, 10) == 0);
  CHECK(inodes.allocate_directory("d", 9999, 1) == 0);
  CHECK(inodes.size() == 3);
}

TEST_CASE("the inode limit is enforced", "[inode]")
{
  inode_namespace inodes(3);
  uint64_t dir = inodes.allocate_torrent_directory(1, "t");
  REQUIRE(dir != 0);
  REQUIRE(inodes.allocate_file("a", dir, 1, 0, 1) != 0);
  CHECK(inodes.allocate_file("b", dir, 1, 1, 1) == 0);
  CHECK(inodes.size() == 3);
}

TEST_CASE("removing a directory removes everything below it", "[inode]")
{
  inode_namespace inodes;
  uint64_t dir = inodes.allocate_torrent_directory(4, "movie");
  uint64_t sub = inodes.allocate_directory("extras", dir, 4);
  uint64_t f1 = inodes.allocate_file("movie.mkv", dir, 4, 0, 100);
  uint64_t f2 = inodes.allocate_file("trailer.mkv", sub, 4, 1, 50);
  uint64_t other = inodes.allocate_torrent_directory(5, "other");

  REQUIRE(inodes.remove(dir));

  CHECK_FALSE(inodes.contains(dir));
  CHECK_FALSE(inodes.contains(sub));
  CHECK_FALSE(inodes.contains(f1));
  CHECK_FALSE(inodes.contains(f2));
  CHECK(inodes.lookup_by_path("/movie") == 0);
  CHECK(inodes.lookup_by_path("/movie/extras/trailer.mkv") == 0);
  CHECK(inodes.lookup_by_torrent(4) == 0);
  CHECK(inodes.children_of(inode_namespace::ROOT_INODE) == std::vector<uint64_t>(1, other));
  CHECK(inodes.torrent_ids() == std::vector<uint64_t>(1, 5));
  CHECK(inodes.size() == 2);

  CHECK_FALSE(inodes.remove(dir));
}

TEST_CASE("the root cannot be removed", "[inode]")
{
  inode_namespace inodes;
  inodes.allocate_torrent_directory(1, "t");
  CHECK_FALSE(inodes.remove(inode_namespace::ROOT_INODE));
  CHECK(inodes.size() == 2);
}

TEST_CASE("inode numbers are never reused", "[inode]")
{
  inode_namespace inodes;
  uint64_t a = inodes.allocate_torrent_directory(1, "a");
  REQUIRE(inodes.remove(a));
  uint64_t b = inodes.allocate_torrent_directory(1, "a");
  CHECK(b > a);
  CHECK(inodes.lookup_by_path("/a") == b);
  CHECK(inodes.lookup_by_torrent(1) == b);
}

TEST_CASE("concurrent allocation hands out unique inodes", "[inode]")
{
  inode_namespace inodes;
  const int threads = 8;
  const int per_thread = 200;

  boost::mutex mtx;
  std::vector<uint64_t> all;
  boost::thread_group group;
  for (int t = 0; t < threads; t++) {
    group.create_thread([&, t]() {
      std::vector<uint64_t> mine;
      uint64_t dir = inodes.allocate_torrent_directory(
        static_cast<uint64_t>(t + 1), "t" + boost::lexical_cast<std::string>(t));
      mine.push_back(dir);
      for (int i = 0; i < per_thread; i++)
        mine.push_back(inodes.allocate_file("f" + boost::lexical_cast<std::string>(i),
                                            dir, static_cast<uint64_t>(t + 1),
                                            static_cast<size_t>(i), 1));
      boost::mutex::scoped_lock lock(mtx);
      all.insert(all.end(), mine.begin(), mine.end());
    });
  }
  group.join_all();

  std::set<uint64_t> unique(all.begin(), all.end());
  CHECK(unique.size() == all.size());
  CHECK(unique.count(0) == 0);
  CHECK(inodes.size() == static_cast<size_t>(1 + threads * (per_thread + 1)));
  CHECK(inodes.children_of(inode_namespace::ROOT_INODE).size()
        == static_cast<size_t>(threads));

  for (int t = 0; t < threads; t++) {
    uint64_t dir = inodes.lookup_by_torrent(static_cast<uint64_t>(t + 1));
    REQUIRE(dir != 0);
    CHECK(inodes.children_of(dir).size() == static_cast<size_t>(per_thread));
  }
}

TEST_CASE("lookups stay consistent while torrents come and go", "[inode]")
{
  inode_namespace inodes;
  const int rounds = 200;

  boost::thread writer([&]() {
    for (int i = 0; i < rounds; i++) {
      uint64_t dir = inodes.allocate_torrent_directory(1, "churn");
      inodes.allocate_file("data.bin", dir, 1, 0, 10);
      inodes.remove(dir);
    }
  });

  int inconsistent = 0;
  for (int i = 0; i < rounds * 5; i++) {
    uint64_t ino = inodes.lookup_by_path("/churn/data.bin");
    if (ino == 0)
      continue;
    inode_entry e;
    /* an entry found by path may vanish, but never turns into another one */
    if (inodes.lookup_by_inode(ino, e) && (e.name != "data.bin" || !e.is_file()))
      inconsistent++;
  }
  writer.join();

  CHECK(inconsistent == 0);
  CHECK(inodes.lookup_by_path("/churn") == 0);
  CHECK(inodes.size() == 1);
}

TEST_CASE("entries never outlive a parent removed while they are added", "[inode]")
{
  inode_namespace inodes;
  const int rounds = 300;
  std::atomic<bool> done(false);

  boost::thread remover([&]() {
    while (!done.load()) {
      uint64_t dir = inodes.lookup_by_torrent(1);
      if (dir != 0)
        inodes.remove(dir);
    }
  });

  for (int i = 0; i < rounds; i++) {
    uint64_t dir = inodes.allocate_torrent_directory(1, "racy");
    if (dir == 0)
      continue;
    for (int j = 0; j < 20; j++) {
      if (inodes.allocate_file("f" + boost::lexical_cast<std::string>(j),
                               dir, 1, static_cast<size_t>(j), 1) == 0)
        break;
    }
    inodes.remove(dir);
  }
  done = true;
  remover.join();

  /* a file linked under a directory that was already being removed would
     survive here */
  CHECK(inodes.size() == 1);
  CHECK(inodes.children_of(inode_namespace::ROOT_INODE).empty());
  CHECK(inodes.lookup_by_path("/racy/f0") == 0);
}
