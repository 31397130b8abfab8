#ifndef LEDGER_ERRORS_HPP_
#define LEDGER_ERRORS_HPP_

#include <functional>
#include <stdexcept>
#include <string>

namespace ledger {

enum class ErrorKind {
  VALIDATION,
  NOT_FOUND,
  UNAUTHORIZED,
  CONFLICT,
  SYSTEMIC
};

/**
 * Base class for every error raised by the ledger core.
 * Business declines are results, never exceptions.
 */
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// Malformed input, rejected before any store mutation.
class ValidationError : public LedgerError {
 public:
  explicit ValidationError(const std::string& message)
      : LedgerError(ErrorKind::VALIDATION, message) {}
};

class NotFoundError : public LedgerError {
 public:
  explicit NotFoundError(const std::string& message)
      : LedgerError(ErrorKind::NOT_FOUND, message) {}
};

// The caller's account holder does not own the resource.
class UnauthorizedError : public LedgerError {
 public:
  explicit UnauthorizedError(const std::string& message)
      : LedgerError(ErrorKind::UNAUTHORIZED, message) {}
};

class ConflictError : public LedgerError {
 public:
  explicit ConflictError(const std::string& message)
      : LedgerError(ErrorKind::CONFLICT, message) {}
};

/**
 * Store-level failure. The unit of work that raised it is rolled back and
 * nothing it wrote is persisted.
 */
class SystemicError : public LedgerError {
 public:
  SystemicError(const std::string& message, bool retryable)
      : LedgerError(ErrorKind::SYSTEMIC, message), retryable_(retryable) {}

  bool retryable() const { return retryable_; }

 private:
  bool retryable_;
};

// A row lock could not be acquired within the configured bound.
class LockTimeoutError : public SystemicError {
 public:
  explicit LockTimeoutError(const std::string& message)
      : SystemicError(message, true) {}
};

class StoreUnavailableError : public SystemicError {
 public:
  explicit StoreUnavailableError(const std::string& message)
      : SystemicError(message, true) {}
};

// A store constraint rejected a write for a reason unrelated to balance checks.
class ConstraintViolationError : public SystemicError {
 public:
  explicit ConstraintViolationError(const std::string& message)
      : SystemicError(message, false) {}
};

/**
 * The store failed after the commit was sent. The writes may be durable,
 * so the operation must not be run again.
 */
class CommitUncertainError : public SystemicError {
 public:
  explicit CommitUncertainError(const std::string& message)
      : SystemicError(message, false) {}
};

std::string toString(ErrorKind kind);

/**
 * Runs `operation`, re-running it while it fails with a retryable
 * SystemicError, up to `max_attempts` runs in total. The last error is
 * rethrown once attempts are exhausted.
 */
template <typename Fn>
auto runWithRetry(int max_attempts, Fn&& operation) -> decltype(operation()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return operation();
    } catch (const SystemicError& e) {
      if (!e.retryable() || attempt >= max_attempts) {
        throw;
      }
    }
  }
}

}  // namespace ledger

#endif  // LEDGER_ERRORS_HPP_
