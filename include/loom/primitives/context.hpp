#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loom::primitives {

// ============================================================================
// value_map - string-keyed scratch storage guarded by its own mutex
// ============================================================================

class value_map {
 public:
  value_map() = default;

  value_map(const value_map& other) : values_(other.snapshot()) {}

  value_map& operator=(const value_map& other) {
    if (this != &other) {
      auto copy = other.snapshot();
      std::scoped_lock lock(mutex_);
      values_ = std::move(copy);
    }
    return *this;
  }

  template <class T>
  void set(const std::string& key, T&& value) {
    std::scoped_lock lock(mutex_);
    values_.insert_or_assign(key, std::any(std::forward<T>(value)));
  }

  void set(const std::string& key, const char* value) {
    set(key, std::string(value));
  }

  // Value stored under key, or nullopt when absent or held with another type.
  template <class T>
  [[nodiscard]] std::optional<T> get(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    auto             it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    if (const T* value = std::any_cast<T>(&it->second)) {
      return *value;
    }
    return std::nullopt;
  }

  template <class T>
  [[nodiscard]] T get_or(const std::string& key, T fallback) const {
    auto value = get<T>(key);
    return value ? std::move(*value) : std::move(fallback);
  }

  [[nodiscard]] bool contains(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    return values_.contains(key);
  }

  bool erase(const std::string& key) {
    std::scoped_lock lock(mutex_);
    return values_.erase(key) > 0;
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(mutex_);
    return values_.size();
  }

  [[nodiscard]] std::vector<std::string> keys() const {
    std::scoped_lock         lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
      result.push_back(key);
    }
    return result;
  }

 private:
  [[nodiscard]] std::unordered_map<std::string, std::any> snapshot() const {
    std::scoped_lock lock(mutex_);
    return values_;
  }

  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, std::any> values_;
};

struct checkpoint_record {
  std::string                           name;
  std::chrono::system_clock::time_point timestamp;
};

namespace _context_detail {

inline std::string random_hex(std::size_t digits) {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  static constexpr char        alphabet[] = "0123456789abcdef";

  std::string out;
  out.reserve(digits);
  std::uint64_t bits = 0;
  for (std::size_t i = 0; i < digits; ++i) {
    if (i % 16 == 0) {
      bits = engine();
    }
    out.push_back(alphabet[bits & 0xF]);
    bits >>= 4;
  }
  return out;
}

// RFC 4122 version 4 layout: 8-4-4-4-12 with the version and variant nibbles set.
inline std::string make_uuid() {
  std::string hex = random_hex(32);
  hex[12]         = '4';
  hex[16]         = "89ab"[hex[16] % 4];
  return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-'
         + hex.substr(16, 4) + '-' + hex.substr(20, 12);
}

// Propagates a stop request from one stop_token to another source.
struct forward_stop {
  std::stop_source target;

  void operator()() noexcept {
    target.request_stop();
  }
};

// State reachable from every context that runs on behalf of the same branch.
struct shared_block {
  value_map                      state;
  value_map                      metadata;
  mutable std::mutex             checkpoints_mutex;
  std::vector<checkpoint_record> checkpoints;
};

}  // namespace _context_detail

// ============================================================================
// context - per-invocation propagated state
// ============================================================================

class context {
 public:
  struct options {
    std::optional<std::string>         correlation_id;
    std::string                        workflow_id;
    std::string                        session_id;
    std::string                        trace_id;
    std::string                        span_id;
    std::map<std::string, std::string> baggage;
    std::map<std::string, std::string> tags;
    std::stop_token                    stop_token;
  };

  context() : context(options{}) {}

  explicit context(options opts)
      : correlation_id_(opts.correlation_id.value_or(_context_detail::make_uuid())),
        workflow_id_(std::move(opts.workflow_id)),
        session_id_(std::move(opts.session_id)),
        trace_id_(opts.trace_id.empty() ? _context_detail::random_hex(32)
                                        : std::move(opts.trace_id)),
        span_id_(opts.span_id.empty() ? _context_detail::random_hex(16)
                                      : std::move(opts.span_id)),
        baggage_(std::move(opts.baggage)),
        tags_(std::move(opts.tags)),
        stop_token_(std::move(opts.stop_token)),
        start_time_(std::chrono::system_clock::now()),
        block_(std::make_shared<_context_detail::shared_block>()) {}

  context(const context&)            = delete;
  context& operator=(const context&) = delete;
  context(context&&) noexcept        = default;
  context& operator=(context&&)      = delete;

  [[nodiscard]] const std::string& correlation_id() const noexcept {
    return correlation_id_;
  }

  [[nodiscard]] const std::string& causation_id() const noexcept {
    return causation_id_;
  }

  [[nodiscard]] const std::string& workflow_id() const noexcept {
    return workflow_id_;
  }

  [[nodiscard]] const std::string& session_id() const noexcept {
    return session_id_;
  }

  [[nodiscard]] const std::string& trace_id() const noexcept {
    return trace_id_;
  }

  [[nodiscard]] const std::string& span_id() const noexcept {
    return span_id_;
  }

  [[nodiscard]] const std::string& parent_span_id() const noexcept {
    return parent_span_id_;
  }

  [[nodiscard]] value_map& state() noexcept {
    return block_->state;
  }

  [[nodiscard]] const value_map& state() const noexcept {
    return block_->state;
  }

  [[nodiscard]] value_map& metadata() noexcept {
    return block_->metadata;
  }

  [[nodiscard]] const value_map& metadata() const noexcept {
    return block_->metadata;
  }

  [[nodiscard]] std::map<std::string, std::string>& baggage() noexcept {
    return baggage_;
  }

  [[nodiscard]] const std::map<std::string, std::string>& baggage() const noexcept {
    return baggage_;
  }

  [[nodiscard]] std::map<std::string, std::string>& tags() noexcept {
    return tags_;
  }

  [[nodiscard]] const std::map<std::string, std::string>& tags() const noexcept {
    return tags_;
  }

  void checkpoint(std::string name) {
    std::scoped_lock lock(block_->checkpoints_mutex);
    block_->checkpoints.push_back({std::move(name), std::chrono::system_clock::now()});
  }

  [[nodiscard]] std::vector<checkpoint_record> checkpoints() const {
    std::scoped_lock lock(block_->checkpoints_mutex);
    return block_->checkpoints;
  }

  [[nodiscard]] std::chrono::milliseconds elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()
                                                                 - start_time_);
  }

  [[nodiscard]] std::stop_token stop_token() const noexcept {
    return stop_token_;
  }

  [[nodiscard]] bool stop_requested() const noexcept {
    return stop_token_.stop_requested();
  }

  // Context for a concurrent branch: same correlation and trace, a fresh span
  // parented to this one, and privately owned copies of state and metadata.
  [[nodiscard]] context create_child() const {
    return create_child(stop_token_);
  }

  [[nodiscard]] context create_child(std::stop_token token) const {
    context child{*this, std::move(token)};
    child.block_           = std::make_shared<_context_detail::shared_block>();
    child.block_->state    = block_->state;
    child.block_->metadata = block_->metadata;
    child.parent_span_id_  = span_id_;
    child.span_id_         = _context_detail::random_hex(16);
    child.causation_id_    = correlation_id_;
    child.start_time_      = std::chrono::system_clock::now();
    return child;
  }

  // Context that shares this one's state, metadata and checkpoints but
  // observes a different stop token. Used when an operation must outlive the
  // caller's wait (soft timeouts).
  [[nodiscard]] context linked(std::stop_token token) const {
    return context{*this, std::move(token)};
  }

 private:
  context(const context& other, std::stop_token token)
      : correlation_id_(other.correlation_id_),
        causation_id_(other.causation_id_),
        workflow_id_(other.workflow_id_),
        session_id_(other.session_id_),
        trace_id_(other.trace_id_),
        span_id_(other.span_id_),
        parent_span_id_(other.parent_span_id_),
        baggage_(other.baggage_),
        tags_(other.tags_),
        stop_token_(std::move(token)),
        start_time_(other.start_time_),
        block_(other.block_) {}

  std::string                                    correlation_id_;
  std::string                                    causation_id_;
  std::string                                    workflow_id_;
  std::string                                    session_id_;
  std::string                                    trace_id_;
  std::string                                    span_id_;
  std::string                                    parent_span_id_;
  std::map<std::string, std::string>             baggage_;
  std::map<std::string, std::string>             tags_;
  std::stop_token                                stop_token_;
  std::chrono::system_clock::time_point          start_time_;
  std::shared_ptr<_context_detail::shared_block> block_;
};

}  // namespace loom::primitives
