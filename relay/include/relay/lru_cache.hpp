/*
 * 설명: 생산자 함수 결과를 키 단위로 메모이즈하는 고정 용량 LRU 캐시.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/lru_cache_test.cpp, relay/tests/unit/token_resolver_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relay {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t joined{0};
  std::uint64_t evictions{0};
};

// 생산자가 예외를 던지면 항목은 저장되지 않고, 같은 키를 기다리던 호출자 모두에게 예외가 전달된다.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
 public:
  using Producer = std::function<Value(const Key&)>;

  LruCache(Producer producer, std::size_t max_size) : producer_(std::move(producer)), max_size_(max_size) {
    if (max_size_ == 0) {
      throw std::invalid_argument("LRU 캐시 용량은 1 이상이어야 합니다");
    }
  }

  LruCache(const LruCache&) = delete;
  LruCache& operator=(const LruCache&) = delete;

  Value Get(const Key& key) {
    std::shared_ptr<InFlight> flight;
    bool owner = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = index_.find(key);
      if (it != index_.end()) {
        entries_.splice(entries_.begin(), entries_, it->second);
        ++stats_.hits;
        return it->second->second;
      }
      auto pending = in_flight_.find(key);
      if (pending != in_flight_.end()) {
        flight = pending->second;
        ++stats_.joined;
      } else {
        flight = std::make_shared<InFlight>();
        flight->result = flight->promise.get_future().share();
        in_flight_.emplace(key, flight);
        ++stats_.misses;
        owner = true;
      }
    }

    if (!owner) {
      return flight->result.get();
    }

    try {
      Value value = producer_(key);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(key);
        InsertLocked(key, value);
      }
      flight->promise.set_value(value);
      return value;
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(key);
      }
      flight->promise.set_exception(std::current_exception());
      throw;
    }
  }

  Value operator()(const Key& key) { return Get(key); }

  void Put(const Key& key, const Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    InsertLocked(key, value);
  }

  // 순서를 바꾸지 않는다.
  bool Contains(const Key& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(key) > 0;
  }

  bool Erase(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    entries_.erase(it->second);
    index_.erase(it);
    return true;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
  }

  // 최근 사용 순서(MRU -> LRU)로 반환한다.
  std::vector<Key> Keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Key> keys;
    keys.reserve(entries_.size());
    for (const auto& entry : entries_) {
      keys.push_back(entry.first);
    }
    return keys;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  std::size_t Capacity() const { return max_size_; }

  CacheStats Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

 private:
  struct InFlight {
    std::promise<Value> promise;
    std::shared_future<Value> result;
  };

  using Entry = std::pair<Key, Value>;

  void InsertLocked(const Key& key, const Value& value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->second = value;
      entries_.splice(entries_.begin(), entries_, it->second);
      return;
    }
    entries_.emplace_front(key, value);
    index_[key] = entries_.begin();
    if (entries_.size() > max_size_) {
      index_.erase(entries_.back().first);
      entries_.pop_back();
      ++stats_.evictions;
    }
  }

  Producer producer_;
  std::size_t max_size_;
  std::list<Entry> entries_;
  std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
  std::unordered_map<Key, std::shared_ptr<InFlight>, Hash> in_flight_;
  CacheStats stats_;
  mutable std::mutex mutex_;
};

}  // namespace relay
