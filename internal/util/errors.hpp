#pragma once

#include <stdexcept>
#include <string>

#include "internal/model/session.hpp"

namespace satp::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Session state disagrees with what the caller expected. Never retried.
class InvalidStateError : public std::runtime_error {
 public:
  explicit InvalidStateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SessionBusyError : public std::runtime_error {
 public:
  explicit SessionBusyError(const std::string& session_id)
      : std::runtime_error("session " + session_id + " is already executing"), session_id_(session_id) {
  }

  const std::string& SessionId() const {
    return session_id_;
  }

 private:
  std::string session_id_;
};

class LedgerInvocationError : public std::runtime_error {
 public:
  explicit LedgerInvocationError(const std::string& msg, bool retryable = true)
      : std::runtime_error(msg), retryable_(retryable) {
  }

  bool Retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

// Raised from a suspension point once shutdown was requested.
class CancelledError : public std::runtime_error {
 public:
  explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Unrecoverable transfer failure reported to the caller.

  The message always reads "failed to transact session <id>: <cause>".
*/
class TransactError : public std::runtime_error {
 public:
  TransactError(std::string session_id, model::ErrorKind kind, model::SessionStatus status, const std::string& cause)
      : std::runtime_error("failed to transact session " + session_id + ": " + cause),
        session_id_(std::move(session_id)),
        kind_(kind),
        status_(status),
        cause_(cause) {
  }

  const std::string& SessionId() const {
    return session_id_;
  }
  model::ErrorKind Kind() const {
    return kind_;
  }
  model::SessionStatus Status() const {
    return status_;
  }
  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::string          session_id_;
  model::ErrorKind     kind_;
  model::SessionStatus status_;
  std::string          cause_;
};

} // namespace satp::util
