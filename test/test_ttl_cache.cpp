#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>
#include "ttl_cache.hpp"

TEST_CASE("cached values are returned until they expire", "[cache]")
{
  ttl_cache<int, std::string> cache(std::chrono::milliseconds(50), 10);
  std::string v;
  CHECK_FALSE(cache.get(1, v));

  cache.put(1, "one");
  REQUIRE(cache.get(1, v));
  CHECK(v == "one");

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK_FALSE(cache.get(1, v));

  cache_stats s = cache.stats();
  CHECK(s.hits == 1);
  CHECK(s.misses == 2);
  CHECK(s.expired == 1);
  CHECK(s.size == 0);
}

TEST_CASE("a full cache drops the least recently used entry", "[cache]")
{
  ttl_cache<int, int> cache(std::chrono::seconds(60), 2);
  int v = 0;
  cache.put(1, 10);
  cache.put(2, 20);
  REQUIRE(cache.get(1, v));

  cache.put(3, 30);
  CHECK(cache.get(1, v));
  CHECK(v == 10);
  CHECK_FALSE(cache.get(2, v));
  CHECK(cache.get(3, v));
  CHECK(cache.stats().evictions == 1);
  CHECK(cache.stats().size == 2);
}

TEST_CASE("entries can be replaced and removed", "[cache]")
{
  ttl_cache<int, int> cache(std::chrono::seconds(60), 2);
  int v = 0;
  cache.put(1, 10);
  cache.put(1, 11);
  REQUIRE(cache.get(1, v));
  CHECK(v == 11);
  CHECK(cache.stats().size == 1);

  cache.remove(1);
  CHECK_FALSE(cache.get(1, v));

  cache.put(2, 20);
  cache.clear();
  CHECK(cache.stats().size == 0);
}

TEST_CASE("a cache without room stores nothing", "[cache]")
{
  ttl_cache<int, int> cache(std::chrono::seconds(60), 0);
  int v = 0;
  cache.put(1, 10);
  CHECK_FALSE(cache.get(1, v));
}
