#pragma once

// arf/sharded_lru.hpp — Per-component state with single-writer-per-key locking.
//
// Keys are routed to a shard by FNV-1a; each shard owns a mutex, a map and an
// LRU list. All access to a value happens inside with()/peek() under that
// shard's lock, so two updates to the same component serialize while
// unrelated components proceed in parallel on other shards.
//
// Capacity is global across shards. An insert that would exceed it evicts the
// least-recently-used key of its own shard; when that shard is empty it evicts
// from the first other shard whose lock is free (try_lock, so no two shard
// locks are ever waited on together). If every other shard is busy the insert
// proceeds and the next insert repays the overshoot, so the size can exceed
// capacity by at most shard_count - 1.

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arf {

// FNV-1a 32-bit hash — deterministic, dependency-free.
inline uint32_t fnv1a_32(std::string_view s) {
  uint32_t hash = 2166136261u;
  for (unsigned char c : s) {
    hash ^= static_cast<uint32_t>(c);
    hash *= 16777619u;
  }
  return hash;
}

template <typename V>
class ShardedLru {
 public:
  ShardedLru(size_t shard_count, size_t capacity) {
    if (shard_count == 0) shard_count = 1;
    if (capacity == 0) capacity = 1;
    capacity_ = capacity;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) shards_.push_back(std::make_unique<Shard>());
  }

  // Run fn(V&) under the key's shard lock, inserting a default V if absent.
  // Marks the key most-recently-used.
  template <typename Fn>
  decltype(auto) with(const std::string& key, Fn&& fn) {
    Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lk(s.mu);
    return fn(touch_or_insert(s, key));
  }

  // Run fn(const V*) under the shard lock without inserting or touching.
  // fn receives nullptr when the key is absent.
  template <typename Fn>
  decltype(auto) peek(const std::string& key, Fn&& fn) const {
    const Shard& s = shard_for(key);
    std::lock_guard<std::mutex> lk(s.mu);
    auto it = s.map.find(key);
    const V* v = (it == s.map.end()) ? nullptr : &it->second.value;
    return fn(v);
  }

  size_t size() const { return size_.load(std::memory_order_relaxed); }
  size_t capacity() const { return capacity_; }

  uint64_t evictions() const { return evictions_.load(std::memory_order_relaxed); }
  size_t shard_count() const { return shards_.size(); }

 private:
  struct Entry {
    V value;
    std::list<std::string>::iterator lru_it;
  };

  struct Shard {
    mutable std::mutex mu;
    std::list<std::string> lru;  // front = most recent
    std::unordered_map<std::string, Entry> map;
  };

  Shard& shard_for(const std::string& key) {
    return *shards_[fnv1a_32(key) % shards_.size()];
  }
  const Shard& shard_for(const std::string& key) const {
    return *shards_[fnv1a_32(key) % shards_.size()];
  }

  // Caller holds s.mu.
  void evict_tail_locked(Shard& s) {
    s.map.erase(s.lru.back());
    s.lru.pop_back();
    size_.fetch_sub(1, std::memory_order_relaxed);
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }

  // Caller holds own.mu. Frees one slot somewhere; false if none could be taken.
  bool evict_one(Shard& own) {
    if (!own.lru.empty()) {
      evict_tail_locked(own);
      return true;
    }
    for (auto& other : shards_) {
      if (other.get() == &own) continue;
      std::unique_lock<std::mutex> lk(other->mu, std::try_to_lock);
      if (!lk.owns_lock() || other->lru.empty()) continue;
      evict_tail_locked(*other);
      return true;
    }
    return false;
  }

  V& touch_or_insert(Shard& s, const std::string& key) {
    auto it = s.map.find(key);
    if (it != s.map.end()) {
      s.lru.splice(s.lru.begin(), s.lru, it->second.lru_it);
      return it->second.value;
    }
    while (size_.load(std::memory_order_relaxed) >= capacity_ && evict_one(s)) {
    }
    s.lru.push_front(key);
    auto [ins, _] = s.map.emplace(key, Entry{V{}, s.lru.begin()});
    size_.fetch_add(1, std::memory_order_relaxed);
    return ins->second.value;
  }

  std::vector<std::unique_ptr<Shard>> shards_;
  size_t capacity_{1};
  std::atomic<size_t> size_{0};
  std::atomic<uint64_t> evictions_{0};
};

}  // namespace arf
