#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "clock.hpp"
#include "errors.hpp"

namespace loom::primitives {

// ============================================================================
// cache_store - where a cache keeps its entries
// ============================================================================
//
// Implementations backed by a remote service throw store_unavailable_error
// when it cannot be reached; callers treat that as a miss and keep going.
// put() hands over the entry's time to live so a store can expire it
// natively; zero means no expiry.
template <class V>
class cache_store {
 public:
  virtual ~cache_store() = default;

  [[nodiscard]] virtual std::optional<V> get(const std::string& key) = 0;
  virtual void put(const std::string& key, V value, std::chrono::milliseconds ttl) = 0;
  virtual bool                           erase(const std::string& key) = 0;
  virtual void                           clear() = 0;
  [[nodiscard]] virtual std::size_t      size() const = 0;

  [[nodiscard]] virtual std::uint64_t evictions() const {
    return 0;
  }

  [[nodiscard]] virtual std::uint64_t expirations() const {
    return 0;
  }
};

// ============================================================================
// lru_store - in-process store with LRU eviction and lazy TTL expiry
// ============================================================================
//
// One mutex guards the map, the recency list and the counters, so get, put
// and eviction are atomic with respect to each other. A zero ttl disables
// expiry. The constructor's ttl applies to puts that do not pass their own.
template <class V>
class lru_store final : public cache_store<V> {
 public:
  lru_store(std::size_t max_size, std::chrono::milliseconds ttl,
            std::shared_ptr<clock> clock = nullptr)
      : max_size_(max_size), ttl_(ttl), clock_(clock ? std::move(clock) : default_clock()) {
    if (max_size_ == 0) {
      throw configuration_error("lru store max_size must be at least 1");
    }
    if (ttl_.count() < 0) {
      throw configuration_error("lru store ttl must not be negative");
    }
  }

  [[nodiscard]] std::optional<V> get(const std::string& key) override {
    std::scoped_lock lock(mutex_);
    auto             it = index_.find(key);
    if (it == index_.end()) {
      return std::nullopt;
    }
    if (expired(*it->second)) {
      drop(it);
      ++expirations_;
      return std::nullopt;
    }
    it->second->last_access = clock_->now();
    order_.splice(order_.begin(), order_, it->second);
    return it->second->value;
  }

  void put(const std::string& key, V value) {
    put(key, std::move(value), ttl_);
  }

  void put(const std::string& key, V value, std::chrono::milliseconds ttl) override {
    if (ttl.count() < 0) {
      throw configuration_error("lru store entry ttl must not be negative");
    }

    std::scoped_lock lock(mutex_);
    const auto       now = clock_->now();
    if (auto it = index_.find(key); it != index_.end()) {
      it->second->value       = std::move(value);
      it->second->inserted_at = now;
      it->second->last_access = now;
      it->second->ttl         = ttl;
      order_.splice(order_.begin(), order_, it->second);
      return;
    }

    order_.push_front(entry{key, std::move(value), now, now, ttl});
    index_.emplace(key, order_.begin());
    while (index_.size() > max_size_) {
      index_.erase(order_.back().key);
      order_.pop_back();
      ++evictions_;
    }
  }

  bool erase(const std::string& key) override {
    std::scoped_lock lock(mutex_);
    auto             it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    drop(it);
    return true;
  }

  void clear() override {
    std::scoped_lock lock(mutex_);
    index_.clear();
    order_.clear();
  }

  // Physical entry count; expired entries linger until next touched.
  [[nodiscard]] std::size_t size() const override {
    std::scoped_lock lock(mutex_);
    return index_.size();
  }

  [[nodiscard]] bool contains(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    auto             it = index_.find(key);
    return it != index_.end() && !expired(*it->second);
  }

  [[nodiscard]] std::uint64_t evictions() const override {
    std::scoped_lock lock(mutex_);
    return evictions_;
  }

  [[nodiscard]] std::uint64_t expirations() const override {
    std::scoped_lock lock(mutex_);
    return expirations_;
  }

  // Visits live entries from most to least recently used without touching
  // their recency. f(key, value) must not call back into the store.
  template <class F>
  void for_each(F&& f) const {
    std::scoped_lock lock(mutex_);
    for (const auto& e : order_) {
      if (!expired(e)) {
        f(e.key, e.value);
      }
    }
  }

 private:
  struct entry {
    std::string               key;
    V                         value;
    clock::time_point         inserted_at;
    clock::time_point         last_access;
    std::chrono::milliseconds ttl;
  };

  using list_t = std::list<entry>;

  [[nodiscard]] bool expired(const entry& e) const {
    return e.ttl.count() > 0 && clock_->now() - e.inserted_at >= e.ttl;
  }

  void drop(typename std::unordered_map<std::string, typename list_t::iterator>::iterator it) {
    order_.erase(it->second);
    index_.erase(it);
  }

  std::size_t                                                max_size_;
  std::chrono::milliseconds                                  ttl_;
  std::shared_ptr<clock>                                     clock_;
  mutable std::mutex                                         mutex_;
  list_t                                                     order_;
  std::unordered_map<std::string, typename list_t::iterator> index_;
  std::uint64_t                                              evictions_   = 0;
  std::uint64_t                                              expirations_ = 0;
};

}  // namespace loom::primitives
