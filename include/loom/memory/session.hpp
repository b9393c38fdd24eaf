#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "loom/primitives/clock.hpp"
#include "store.hpp"
#include "types.hpp"

namespace loom::memory {

// ============================================================================
// session_memory - append-only conversation history per session
// ============================================================================

struct message {
  std::string                           role;
  std::string                           content;
  std::map<std::string, std::string>    metadata;
  std::chrono::system_clock::time_point timestamp{};
};

// Records exchanged through memory_layer use the session id as key and carry
// the role in attributes["role"].
class session_memory final : public memory_layer {
 public:
  // max_messages bounds each session's history (oldest dropped first); 0
  // keeps everything.
  explicit session_memory(std::shared_ptr<clock> time = nullptr, std::size_t max_messages = 0)
      : clock_(time ? std::move(time) : primitives::default_clock()), max_messages_(max_messages) {}

  void append(const std::string& session_id, message msg) {
    if (msg.timestamp == std::chrono::system_clock::time_point{}) {
      msg.timestamp = clock_->wall_now();
    }
    std::scoped_lock lock(mutex_);
    auto&            history = sessions_[session_id];
    history.push_back(std::move(msg));
    if (max_messages_ != 0 && history.size() > max_messages_) {
      history.erase(history.begin(),
                    history.begin() + static_cast<std::ptrdiff_t>(history.size() - max_messages_));
    }
  }

  // Whole history, or its last `limit` messages.
  [[nodiscard]] std::vector<message> history(const std::string&         session_id,
                                             std::optional<std::size_t> limit = std::nullopt) const {
    std::scoped_lock lock(mutex_);
    auto             it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return {};
    }
    const auto& all = it->second;
    if (!limit || *limit >= all.size()) {
      return all;
    }
    return {all.end() - static_cast<std::ptrdiff_t>(*limit), all.end()};
  }

  // Messages no older than `recent`.
  [[nodiscard]] std::vector<message> window(const std::string&                    session_id,
                                            std::chrono::system_clock::duration recent) const {
    return since(session_id, clock_->wall_now() - recent);
  }

  [[nodiscard]] std::vector<message> since(const std::string&                    session_id,
                                           std::chrono::system_clock::time_point cutoff) const {
    std::scoped_lock     lock(mutex_);
    std::vector<message> out;
    auto                 it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return out;
    }
    for (const auto& msg : it->second) {
      if (msg.timestamp >= cutoff) {
        out.push_back(msg);
      }
    }
    return out;
  }

  [[nodiscard]] std::size_t size(const std::string& session_id) const {
    std::scoped_lock lock(mutex_);
    auto             it = sessions_.find(session_id);
    return it == sessions_.end() ? 0 : it->second.size();
  }

  [[nodiscard]] std::vector<std::string> sessions() const {
    std::scoped_lock         lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, history] : sessions_) {
      ids.push_back(id);
    }
    return ids;
  }

  bool clear(const std::string& session_id) {
    std::scoped_lock lock(mutex_);
    return sessions_.erase(session_id) > 0;
  }

  // memory_layer

  void add(memory_record record) override {
    message msg;
    if (auto role = record.attributes.find("role"); role != record.attributes.end()) {
      msg.role = role->second;
      record.attributes.erase(role);
    } else {
      msg.role = "user";
    }
    msg.content   = std::move(record.content);
    msg.metadata  = std::move(record.attributes);
    msg.timestamp = record.created_at;
    append(record.key, std::move(msg));
  }

  // Latest message of the session.
  [[nodiscard]] std::optional<memory_record> get(const std::string& key) const override {
    auto last = history(key, 1);
    if (last.empty()) {
      return std::nullopt;
    }
    return to_record(key, last.front());
  }

  // Messages of the session named by filters tag "session:<id>", or of all
  // sessions when no such tag is given.
  [[nodiscard]] std::vector<memory_record> search(const search_query& query) const override {
    std::vector<std::pair<double, memory_record>> scored;
    std::optional<std::string>                    only;
    for (const auto& tag : query.filters.tags) {
      if (tag.starts_with("session:")) {
        only = tag.substr(8);
      }
    }

    search_filters rest = query.filters;
    std::erase_if(rest.tags, [](const std::string& t) -> bool { return t.starts_with("session:"); });

    std::scoped_lock lock(mutex_);
    for (const auto& [id, history] : sessions_) {
      if (only && *only != id) {
        continue;
      }
      for (const auto& msg : history) {
        auto record = to_record(id, msg);
        if (!rest.matches(record)) {
          continue;
        }
        const double score = keyword_relevance(query.text, record);
        if (score > 0.0) {
          scored.emplace_back(score, std::move(record));
        }
      }
    }
    return rank(std::move(scored), query.limit);
  }

  [[nodiscard]] validation_result validate(const std::string& key,
                                           const fact_value&  actual) const noexcept override {
    try {
      return presence_result("session memory", key, size(key) > 0, actual);
    } catch (const std::exception& e) {
      validation_result result;
      result.key     = key;
      result.message = e.what();
      return result;
    }
  }

 private:
  static memory_record to_record(const std::string& session_id, const message& msg) {
    memory_record record;
    record.key        = session_id;
    record.content    = msg.content;
    record.created_at = msg.timestamp;
    record.attributes = msg.metadata;
    record.attributes["role"] = msg.role;
    return record;
  }

  std::shared_ptr<clock>                                 clock_;
  std::size_t                                            max_messages_;
  mutable std::mutex                                     mutex_;
  std::unordered_map<std::string, std::vector<message>> sessions_;
};

}  // namespace loom::memory
