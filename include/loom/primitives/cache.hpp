#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "clock.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "lru_store.hpp"
#include "primitive.hpp"

namespace loom::primitives {

// ============================================================================
// cache - memoizes a primitive's results by key
// ============================================================================

template <class In>
using cache_key_fn = std::function<std::string(const In&, const context&)>;

struct cache_options {
  std::string               name = "cache";
  std::chrono::milliseconds ttl{3'600'000};
  std::size_t               max_size = 1000;
  // Concurrent misses on one key wait for the first caller's result instead
  // of each invoking the wrapped primitive.
  bool                               single_flight = true;
  std::shared_ptr<primitives::clock> clock;
  sink_ptr                           sink;
};

// What a cache keeps per key. The cache checks stored_at against its own
// clock on every read, so expiry holds whatever the store does with the ttl.
template <class Out>
struct cache_entry {
  Out               value;
  clock::time_point stored_at;
};

struct cache_stats {
  std::uint64_t hits        = 0;
  std::uint64_t misses      = 0;
  std::uint64_t evictions   = 0;
  std::uint64_t expirations = 0;
  std::size_t   size        = 0;

  [[nodiscard]] double hit_rate() const noexcept {
    const auto total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

namespace _cache_detail {

// Hash of the input's fmt rendering. Empty for inputs fmt cannot format.
template <class In>
cache_key_fn<In> default_key_fn() {
  if constexpr (fmt::is_formattable<In>::value) {
    return [](const In& input, const context& /*unused*/) -> std::string {
      return fmt::format("{:016x}", std::hash<std::string>{}(fmt::format("{}", input)));
    };
  } else {
    return {};
  }
}

template <class Out>
struct flight {
  std::promise<Out>       promise;
  std::shared_future<Out> result = promise.get_future().share();
};

}  // namespace _cache_detail

template <class In, class Out>
class cache final : public primitive<In, Out> {
 public:
  cache(primitive_ptr<In, Out> inner, cache_options opts, cache_key_fn<In> key_fn = {},
        std::shared_ptr<cache_store<cache_entry<Out>>> store = nullptr)
      : primitive<In, Out>(std::move(opts.name), std::move(opts.sink)),
        inner_(std::move(inner)),
        key_fn_(key_fn ? std::move(key_fn) : _cache_detail::default_key_fn<In>()),
        single_flight_(opts.single_flight),
        ttl_(opts.ttl),
        clock_(opts.clock ? std::move(opts.clock) : default_clock()) {
    if (!inner_) {
      throw configuration_error("cache '" + this->name() + "' wraps nothing");
    }
    if (!key_fn_) {
      throw configuration_error("cache '" + this->name()
                                + "' needs a key function for an input fmt cannot format");
    }
    if (ttl_.count() < 0) {
      throw configuration_error("cache '" + this->name() + "' ttl must not be negative");
    }
    store_ = store ? std::move(store)
                   : std::make_shared<lru_store<cache_entry<Out>>>(opts.max_size, ttl_, clock_);
  }

  [[nodiscard]] cache_stats stats() const {
    cache_stats s;
    s.hits        = hits_.load(std::memory_order_relaxed);
    s.misses      = misses_.load(std::memory_order_relaxed);
    s.evictions   = store_->evictions();
    s.expirations = store_->expirations() + expirations_.load(std::memory_order_relaxed);
    s.size        = store_->size();
    return s;
  }

  // Key the cache would use for this input.
  [[nodiscard]] std::string key_for(const In& input, const context& ctx) const {
    return key_fn_(input, ctx);
  }

  bool invalidate(const std::string& key) {
    try {
      return store_->erase(key);
    } catch (const store_unavailable_error& e) {
      logger()->warn("{} could not invalidate '{}': {}", this->name(), key, e.what());
      return false;
    }
  }

  void clear() {
    try {
      store_->clear();
    } catch (const store_unavailable_error& e) {
      logger()->warn("{} could not clear its store: {}", this->name(), e.what());
    }
  }

 protected:
  Out do_execute(In input, context& ctx) override {
    const std::string key = key_fn_(input, ctx);

    if (auto hit = lookup(key)) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      logger()->debug("{} hit {}", this->name(), key);
      this->count("cache.hits");
      return std::move(*hit);
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    logger()->debug("{} miss {}", this->name(), key);
    this->count("cache.misses");

    if (!single_flight_) {
      Out value = inner_->execute(std::move(input), ctx);
      remember(key, value);
      return value;
    }

    std::shared_ptr<_cache_detail::flight<Out>> f;
    bool                                        leader = false;
    {
      std::scoped_lock lock(flights_mutex_);
      if (auto it = flights_.find(key); it != flights_.end()) {
        f = it->second;
      } else {
        f = std::make_shared<_cache_detail::flight<Out>>();
        flights_.emplace(key, f);
        leader = true;
      }
    }
    if (!leader) {
      this->count("cache.coalesced");
      return f->result.get();
    }

    try {
      // A flight that just landed may have filled the store.
      std::optional<Out> value = lookup(key);
      if (!value) {
        value.emplace(inner_->execute(std::move(input), ctx));
        remember(key, *value);
      }
      f->promise.set_value(*value);
      land(key);
      return std::move(*value);
    } catch (...) {
      f->promise.set_exception(std::current_exception());
      land(key);
      throw;
    }
  }

 private:
  std::optional<Out> lookup(const std::string& key) {
    std::optional<cache_entry<Out>> entry;
    try {
      entry = store_->get(key);
    } catch (const store_unavailable_error& e) {
      logger()->warn("{} store unavailable, executing directly: {}", this->name(), e.what());
      this->count("cache.store_unavailable");
      return std::nullopt;
    }
    if (!entry) {
      return std::nullopt;
    }

    if (ttl_.count() > 0 && clock_->now() - entry->stored_at >= ttl_) {
      expirations_.fetch_add(1, std::memory_order_relaxed);
      logger()->debug("{} expired {}", this->name(), key);
      invalidate(key);
      return std::nullopt;
    }
    return std::move(entry->value);
  }

  void remember(const std::string& key, const Out& value) {
    try {
      store_->put(key, cache_entry<Out>{value, clock_->now()}, ttl_);
    } catch (const store_unavailable_error& e) {
      logger()->warn("{} store unavailable, result not cached: {}", this->name(), e.what());
      this->count("cache.store_unavailable");
    }
  }

  void land(const std::string& key) {
    std::scoped_lock lock(flights_mutex_);
    flights_.erase(key);
  }

  primitive_ptr<In, Out>                                                       inner_;
  cache_key_fn<In>                                                             key_fn_;
  bool                                                                         single_flight_;
  std::chrono::milliseconds                                                    ttl_;
  std::shared_ptr<primitives::clock>                                           clock_;
  std::shared_ptr<cache_store<cache_entry<Out>>>                               store_;
  std::atomic<std::uint64_t>                                                   hits_{0};
  std::atomic<std::uint64_t>                                                   misses_{0};
  std::atomic<std::uint64_t>                                                   expirations_{0};
  std::mutex                                                                   flights_mutex_;
  std::unordered_map<std::string, std::shared_ptr<_cache_detail::flight<Out>>> flights_;
};

template <primitive_handle H>
auto cached(H&& inner, cache_options opts = {}, cache_key_fn<input_of_t<H>> key_fn = {},
            std::shared_ptr<cache_store<cache_entry<output_of_t<H>>>> store = nullptr) {
  using impl_t = cache<input_of_t<H>, output_of_t<H>>;
  return std::make_shared<impl_t>(as_primitive(std::forward<H>(inner)), std::move(opts),
                                  std::move(key_fn), std::move(store));
}

}  // namespace loom::primitives
