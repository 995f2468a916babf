// Small thread-safe cache whose entries expire after a fixed time. When full,
// the least recently used entry makes room.

#ifndef ttl_cache_h
#define ttl_cache_h

#include <stddef.h>
#include <stdint.h>
#include <chrono>
#include <boost/thread/mutex.hpp>
#include <boost/unordered_map.hpp>

struct cache_stats {
  uint64_t hits;
  uint64_t misses;
  uint64_t evictions;
  uint64_t expired;
  size_t size;
};

template <typename K, typename V>
class ttl_cache {
public:
  ttl_cache(std::chrono::milliseconds ttl, size_t max_entries)
    : ttl(ttl), max_entries(max_entries), seq(0) {
    stats_.hits = stats_.misses = stats_.evictions = stats_.expired = 0;
    stats_.size = 0;
  }

  bool get(const K &key, V &out) {
    boost::mutex::scoped_lock lock(mtx);
    typename map_type::iterator it = entries.find(key);
    if (it == entries.end()) {
      stats_.misses++;
      return false;
    }
    if (clock::now() - it->second.created > ttl) {
      entries.erase(it);
      stats_.expired++;
      stats_.misses++;
      return false;
    }
    it->second.last_used = ++seq;
    stats_.hits++;
    out = it->second.value;
    return true;
  }

  void put(const K &key, const V &value) {
    boost::mutex::scoped_lock lock(mtx);
    if (max_entries == 0)
      return;
    if (entries.find(key) == entries.end() && entries.size() >= max_entries)
      evict_one();
    entry &e = entries[key];
    e.value = value;
    e.created = clock::now();
    e.last_used = ++seq;
  }

  void remove(const K &key) {
    boost::mutex::scoped_lock lock(mtx);
    entries.erase(key);
  }

  void clear() {
    boost::mutex::scoped_lock lock(mtx);
    entries.clear();
  }

  cache_stats stats() const {
    boost::mutex::scoped_lock lock(mtx);
    cache_stats s = stats_;
    s.size = entries.size();
    return s;
  }

private:
  typedef std::chrono::steady_clock clock;

  struct entry {
    V value;
    clock::time_point created;
    uint64_t last_used;
  };

  typedef boost::unordered_map<K, entry> map_type;

  /* expired entries go first, then the least recently used one */
  void evict_one() {
    clock::time_point now = clock::now();
    typename map_type::iterator victim = entries.end();
    for (typename map_type::iterator it = entries.begin(); it != entries.end(); ++it) {
      if (now - it->second.created > ttl) {
        entries.erase(it);
        stats_.expired++;
        return;
      }
      if (victim == entries.end() || it->second.last_used < victim->second.last_used)
        victim = it;
    }
    if (victim != entries.end()) {
      entries.erase(victim);
      stats_.evictions++;
    }
  }

  mutable boost::mutex mtx;
  map_type entries;
  std::chrono::milliseconds ttl;
  size_t max_entries;
  uint64_t seq;
  cache_stats stats_;
};

#endif //ttl_cache_h
