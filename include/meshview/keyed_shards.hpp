#pragma once
/**
 * @file keyed_shards.hpp
 * @brief Lock-striped hash map: one mutex per shard, shard chosen by key hash.
 *
 * Writers touching different keys almost always take different mutexes, so
 * unrelated packets and nodes never serialize behind one global lock. All
 * access goes through callbacks that run with the shard locked; references
 * handed to a callback must not escape it.
 */

#include <stddef.h>
#include <array>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace meshview {

template <typename K, typename V, size_t SHARDS = 64>
class ShardedMap {
public:
  /// Run @p fn(map&) with the shard owning @p key locked.
  template <typename F>
  auto with_shard(const K& key, F&& fn) {
    Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lk(s.mu);
    return fn(s.map);
  }

  template <typename F>
  auto with_shard(const K& key, F&& fn) const {
    const Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lk(s.mu);
    return fn(static_cast<const std::unordered_map<K, V>&>(s.map));
  }

  /// Visit every entry, one shard locked at a time (no global snapshot).
  template <typename F>
  void for_each(F&& fn) const {
    for (const Shard& s : shards_) {
      std::lock_guard<std::mutex> lk(s.mu);
      for (const auto& kv : s.map) fn(kv.first, kv.second);
    }
  }

  size_t size() const {
    size_t n = 0;
    for (const Shard& s : shards_) {
      std::lock_guard<std::mutex> lk(s.mu);
      n += s.map.size();
    }
    return n;
  }

private:
  struct Shard {
    mutable std::mutex mu;
    std::unordered_map<K, V> map;
  };

  Shard& shard_for(const K& key) { return shards_[std::hash<K>{}(key) % SHARDS]; }
  const Shard& shard_for(const K& key) const { return shards_[std::hash<K>{}(key) % SHARDS]; }

  std::array<Shard, SHARDS> shards_;
};

} // namespace meshview
