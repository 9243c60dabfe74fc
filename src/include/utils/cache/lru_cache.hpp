//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.


#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace photograph {
template <typename K>
concept Hashable = std::copy_constructible<K> && std::equality_comparable<K> && requires(K key) {
  { std::hash<K>{}(key) } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Fixed-capacity least-recently-used map. The front of the list is the most recent
 * entry. Not synchronized; callers hold their own lock.
 */
template <Hashable K, typename V>
class LRUCache {
  using ListIterator = typename std::list<std::pair<K, V>>::iterator;

 private:
  std::unordered_map<K, ListIterator> cache_map_;
  std::list<std::pair<K, V>>          cache_list_;
  size_t                              capacity_;

  size_t                              evict_count_ = 0;

 public:
  static constexpr size_t default_capacity_ = 256;

  explicit LRUCache() : capacity_(default_capacity_) {}
  explicit LRUCache(size_t capacity) : capacity_(capacity) {}

  auto Contains(const K& key) const -> bool { return cache_map_.contains(key); }
  auto Size() const -> size_t { return cache_list_.size(); }
  auto Capacity() const -> size_t { return capacity_; }
  auto EvictCount() const -> size_t { return evict_count_; }

  /**
   * @brief Look up `key` and mark it as most recently used.
   */
  auto AccessElement(const K& key) -> std::optional<V> {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return std::nullopt;
    }
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->second;
  }

  /**
   * @brief Insert or replace `key`. A new key evicts the least recently used entry when the
   * cache is full. A zero-capacity cache stores nothing.
   */
  void RecordAccess(const K& key, V val) {
    if (capacity_ == 0) return;
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
      cache_list_.front().second = std::move(val);
      return;
    }
    if (cache_list_.size() >= capacity_) {
      Evict();
    }
    cache_list_.emplace_front(key, std::move(val));
    cache_map_[key] = cache_list_.begin();
  }

  void RemoveRecord(const K& key) {
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
      cache_list_.erase(it->second);
      cache_map_.erase(it);
    }
  }

  auto Evict() -> std::optional<V> {
    if (cache_list_.empty()) {
      return std::nullopt;
    }
    auto last = std::prev(cache_list_.end());
    cache_map_.erase(last->first);
    std::optional<V> evicted = std::move(last->second);
    cache_list_.pop_back();
    ++evict_count_;
    return evicted;
  }

  void Flush() {
    cache_map_.clear();
    cache_list_.clear();
  }
};
};  // namespace photograph
