#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "loom/primitives/clock.hpp"
#include "loom/primitives/errors.hpp"
#include "loom/primitives/logging.hpp"
#include "loom/primitives/lru_store.hpp"
#include "types.hpp"

namespace loom::memory {

using primitives::clock;
using primitives::configuration_error;
using primitives::logger;
using primitives::store_unavailable_error;

// ============================================================================
// Keyword relevance - the baseline ranking
// ============================================================================

namespace _store_detail {

inline std::string lowercase(std::string_view text) {
  std::string out(text);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) -> char { return static_cast<char>(std::tolower(c)); });
  return out;
}

inline std::vector<std::string> terms(std::string_view text) {
  std::vector<std::string> out;
  std::string              current;
  for (unsigned char c : text) {
    if (std::isalnum(c) != 0 || c == '-' || c == '_') {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      out.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

}  // namespace _store_detail

// Fraction of query terms found in the record's content, key or tags. An
// empty query matches everything with score 1.
inline double keyword_relevance(std::string_view query, const memory_record& record) {
  const auto words = _store_detail::terms(query);
  if (words.empty()) {
    return 1.0;
  }

  const auto  content = _store_detail::lowercase(record.content);
  const auto  key     = _store_detail::lowercase(record.key);
  std::size_t matched = 0;
  for (const auto& word : words) {
    bool hit = content.find(word) != std::string::npos || key.find(word) != std::string::npos;
    for (const auto& tag : record.tags) {
      if (hit) {
        break;
      }
      hit = _store_detail::lowercase(tag) == word;
    }
    matched += hit ? 1 : 0;
  }
  return static_cast<double>(matched) / static_cast<double>(words.size());
}

// Orders by score, then importance, then recency; keeps the first k.
inline std::vector<memory_record> rank(std::vector<std::pair<double, memory_record>> scored,
                                       std::size_t                                   k) {
  std::ranges::stable_sort(scored, [](const auto& a, const auto& b) -> bool {
    if (a.first != b.first) {
      return a.first > b.first;
    }
    if (a.second.importance != b.second.importance) {
      return a.second.importance > b.second.importance;
    }
    return a.second.created_at > b.second.created_at;
  });
  if (scored.size() > k) {
    scored.resize(k);
  }

  std::vector<memory_record> out;
  out.reserve(scored.size());
  for (auto& [score, record] : scored) {
    out.push_back(std::move(record));
  }
  return out;
}

// ============================================================================
// memory_store - backing storage for records
// ============================================================================
//
// A remote implementation throws store_unavailable_error when its service
// cannot be reached.
class memory_store {
 public:
  virtual ~memory_store() = default;

  virtual void add(const std::string& key, memory_record record,
                   std::optional<std::chrono::milliseconds> ttl) = 0;

  [[nodiscard]] virtual std::optional<memory_record> get(const std::string& key) = 0;

  // Records matching filters and query text, best first, at most k. An empty
  // query matches every record that passes the filters.
  [[nodiscard]] virtual std::vector<memory_record> search(const std::string&    query,
                                                          std::size_t           k,
                                                          const search_filters& filters) = 0;

  virtual bool erase(const std::string& key) = 0;
};

// ============================================================================
// in_memory_store - zero-dependency store, complete on its own
// ============================================================================

class in_memory_store final : public memory_store {
 public:
  explicit in_memory_store(std::size_t max_size = 10'000, std::shared_ptr<clock> time = nullptr)
      : clock_(time ? std::move(time) : primitives::default_clock()),
        entries_(max_size, std::chrono::milliseconds(0), clock_) {}

  void add(const std::string& key, memory_record record,
           std::optional<std::chrono::milliseconds> ttl) override {
    if (ttl && ttl->count() <= 0) {
      throw configuration_error("memory ttl must be positive");
    }
    record.key = key;
    if (record.created_at == std::chrono::system_clock::time_point{}) {
      record.created_at = clock_->wall_now();
    }
    std::optional<clock::time_point> expires_at;
    if (ttl) {
      expires_at = clock_->now() + *ttl;
    }
    entries_.put(key, stored{std::move(record), expires_at});
  }

  [[nodiscard]] std::optional<memory_record> get(const std::string& key) override {
    auto entry = entries_.get(key);
    if (!entry) {
      return std::nullopt;
    }
    if (expired(*entry)) {
      entries_.erase(key);
      return std::nullopt;
    }
    return std::move(entry->record);
  }

  [[nodiscard]] std::vector<memory_record> search(const std::string& query, std::size_t k,
                                                  const search_filters& filters) override {
    std::vector<std::pair<double, memory_record>> scored;
    entries_.for_each([&](const std::string& /*key*/, const stored& entry) -> void {
      if (expired(entry) || !filters.matches(entry.record)) {
        return;
      }
      const double score = keyword_relevance(query, entry.record);
      if (score > 0.0) {
        scored.emplace_back(score, entry.record);
      }
    });
    return rank(std::move(scored), k);
  }

  bool erase(const std::string& key) override {
    return entries_.erase(key);
  }

  [[nodiscard]] std::size_t size() const {
    return entries_.size();
  }

 private:
  struct stored {
    memory_record                    record;
    std::optional<clock::time_point> expires_at;
  };

  [[nodiscard]] bool expired(const stored& entry) const {
    return entry.expires_at && clock_->now() >= *entry.expires_at;
  }

  std::shared_ptr<clock>        clock_;
  primitives::lru_store<stored> entries_;
};

// ============================================================================
// fallback_store - remote when reachable, in-process otherwise
// ============================================================================
//
// Writes always land in the local store as well, so the first
// store_unavailable_error switches every later call to the local store
// without losing what was written through this instance.
class fallback_store final : public memory_store {
 public:
  fallback_store(std::shared_ptr<memory_store> remote, std::shared_ptr<in_memory_store> local)
      : remote_(std::move(remote)), local_(std::move(local)) {
    if (!local_) {
      throw configuration_error("fallback store needs a local store");
    }
  }

  void add(const std::string& key, memory_record record,
           std::optional<std::chrono::milliseconds> ttl) override {
    local_->add(key, record, ttl);
    if (use_remote()) {
      try {
        remote_->add(key, std::move(record), ttl);
      } catch (const store_unavailable_error& e) {
        degrade(e);
      }
    }
  }

  [[nodiscard]] std::optional<memory_record> get(const std::string& key) override {
    if (use_remote()) {
      try {
        if (auto record = remote_->get(key)) {
          return record;
        }
      } catch (const store_unavailable_error& e) {
        degrade(e);
      }
    }
    return local_->get(key);
  }

  [[nodiscard]] std::vector<memory_record> search(const std::string& query, std::size_t k,
                                                  const search_filters& filters) override {
    if (use_remote()) {
      try {
        return remote_->search(query, k, filters);
      } catch (const store_unavailable_error& e) {
        degrade(e);
      }
    }
    return local_->search(query, k, filters);
  }

  bool erase(const std::string& key) override {
    bool erased = local_->erase(key);
    if (use_remote()) {
      try {
        erased = remote_->erase(key) || erased;
      } catch (const store_unavailable_error& e) {
        degrade(e);
      }
    }
    return erased;
  }

  [[nodiscard]] bool degraded() const noexcept {
    return degraded_.load(std::memory_order_acquire);
  }

 private:
  [[nodiscard]] bool use_remote() const noexcept {
    return remote_ && !degraded();
  }

  void degrade(const store_unavailable_error& e) {
    if (!degraded_.exchange(true, std::memory_order_acq_rel)) {
      logger()->warn("remote memory store unavailable, continuing in-process: {}", e.what());
    }
  }

  std::shared_ptr<memory_store>    remote_;
  std::shared_ptr<in_memory_store> local_;
  std::atomic<bool>                degraded_{false};
};

}  // namespace loom::memory
