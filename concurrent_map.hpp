// Hash map split into independently locked shards so that readers and
// writers on different keys rarely contend.

#ifndef concurrent_map_h
#define concurrent_map_h

#include <stddef.h>
#include <utility>
#include <vector>
#include <boost/functional/hash.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/unordered_map.hpp>

template <typename K, typename V, typename Hash = boost::hash<K> >
class concurrent_map {
public:
  /* false if the key was already present */
  bool insert(const K &key, const V &value) {
    shard &s = shard_for(key);
    boost::unique_lock<boost::shared_mutex> lock(s.mtx);
    return s.map.insert(std::make_pair(key, value)).second;
  }

  void insert_or_assign(const K &key, const V &value) {
    shard &s = shard_for(key);
    boost::unique_lock<boost::shared_mutex> lock(s.mtx);
    s.map[key] = value;
  }

  bool get(const K &key, V &out) const {
    const shard &s = shard_for(key);
    boost::shared_lock<boost::shared_mutex> lock(s.mtx);
    typename map_type::const_iterator it = s.map.find(key);
    if (it == s.map.end())
      return false;
    out = it->second;
    return true;
  }

  bool contains(const K &key) const {
    const shard &s = shard_for(key);
    boost::shared_lock<boost::shared_mutex> lock(s.mtx);
    return s.map.find(key) != s.map.end();
  }

  bool erase(const K &key) {
    shard &s = shard_for(key);
    boost::unique_lock<boost::shared_mutex> lock(s.mtx);
    return s.map.erase(key) > 0;
  }

  /* Erases the key only while it still maps to `expected` */
  bool erase_if_equal(const K &key, const V &expected) {
    shard &s = shard_for(key);
    boost::unique_lock<boost::shared_mutex> lock(s.mtx);
    typename map_type::iterator it = s.map.find(key);
    if (it == s.map.end() || !(it->second == expected))
      return false;
    s.map.erase(it);
    return true;
  }

  /* Runs f(value&) under the shard's write lock */
  template <typename F>
  bool update(const K &key, F f) {
    shard &s = shard_for(key);
    boost::unique_lock<boost::shared_mutex> lock(s.mtx);
    typename map_type::iterator it = s.map.find(key);
    if (it == s.map.end())
      return false;
    f(it->second);
    return true;
  }

  size_t size() const {
    size_t n = 0;
    for (size_t i = 0; i < shard_count; i++) {
      boost::shared_lock<boost::shared_mutex> lock(shards[i].mtx);
      n += shards[i].map.size();
    }
    return n;
  }

  /* Copy of the contents. Not a consistent cut across shards. */
  std::vector<std::pair<K, V> > snapshot() const {
    std::vector<std::pair<K, V> > out;
    for (size_t i = 0; i < shard_count; i++) {
      boost::shared_lock<boost::shared_mutex> lock(shards[i].mtx);
      out.insert(out.end(), shards[i].map.begin(), shards[i].map.end());
    }
    return out;
  }

  void clear() {
    for (size_t i = 0; i < shard_count; i++) {
      boost::unique_lock<boost::shared_mutex> lock(shards[i].mtx);
      shards[i].map.clear();
    }
  }

private:
  typedef boost::unordered_map<K, V, Hash> map_type;

  struct shard {
    mutable boost::shared_mutex mtx;
    map_type map;
  };

  static const size_t shard_count = 16;

  shard& shard_for(const K &key) {
    return shards[Hash()(key) % shard_count];
  }

  const shard& shard_for(const K &key) const {
    return shards[Hash()(key) % shard_count];
  }

  shard shards[shard_count];
};

#endif //concurrent_map_h
