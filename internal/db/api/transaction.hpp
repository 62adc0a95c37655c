#pragma once

#include <stdexcept>
#include <string>

namespace satp::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if not committed
  - Commit throws TransactionConflict when a concurrent writer won

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
*/

// Commit lost a race with a concurrent writer of the same session.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
  virtual bool IsCommitted() const = 0;
};

} // namespace satp::db
