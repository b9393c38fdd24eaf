#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace loom::primitives {

// ============================================================================
// Error taxonomy
// ============================================================================

// Base of every error raised by loom itself. Errors raised by leaf operations
// travel unchanged; loom only annotates its own types.
class error : public std::runtime_error {
 public:
  explicit error(const std::string& what) : std::runtime_error(what) {}

  [[nodiscard]] virtual bool retryable() const noexcept {
    return true;
  }

  // Number of attempts made before this error escaped a retry decorator (0 if
  // it never passed through one).
  [[nodiscard]] std::size_t attempts() const noexcept {
    return attempts_;
  }

  void annotate_attempts(std::size_t attempts) noexcept {
    attempts_ = attempts;
  }

 private:
  std::size_t attempts_ = 0;
};

// Native failure of a wrapped leaf, for leaves that want to report through
// the taxonomy rather than with their own exception types.
class operation_error : public error {
 public:
  using error::error;
};

class timeout_error : public error {
 public:
  using error::error;
};

class routing_error : public error {
 public:
  using error::error;
};

class configuration_error : public error {
 public:
  using error::error;

  [[nodiscard]] bool retryable() const noexcept override {
    return false;
  }
};

// Raised by cache and memory backends that cannot be reached. Callers
// degrade to the in-process path instead of failing.
class store_unavailable_error : public error {
 public:
  using error::error;
};

class validation_error : public error {
 public:
  using error::error;

  [[nodiscard]] bool retryable() const noexcept override {
    return false;
  }
};

class circuit_open_error : public error {
 public:
  using error::error;
};

// Message of an in-flight exception, for logging and reports.
inline std::string describe(const std::exception_ptr& ep) {
  if (!ep) {
    return "no error";
  }
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

// Default retryability: loom errors decide for themselves, anything else is
// considered transient.
inline bool is_retryable(const std::exception_ptr& ep) noexcept {
  if (!ep) {
    return false;
  }
  try {
    std::rethrow_exception(ep);
  } catch (const error& e) {
    return e.retryable();
  } catch (...) {
    return true;
  }
}

}  // namespace loom::primitives
