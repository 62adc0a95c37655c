#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace satp::db::memory {

/*
  Transaction = snapshot + write set.

  Conflicts are detected per session: Commit throws TransactionConflict only
  if a session this transaction wrote was changed by another commit after
  the snapshot.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void TouchSession(const std::string& id) {
    touched_sessions_.insert(id);
  }
  void TouchAudit(const std::string& id) {
    touched_audit_.insert(id);
  }

 private:
  static bool SameRow(const MemoryRepository::State& a, const MemoryRepository::State& b, const std::string& id);

  MemoryRepository&       repo_;
  MemoryRepository::State snapshot_;
  MemoryRepository::State working_;
  std::set<std::string>   touched_sessions_;
  std::set<std::string>   touched_audit_;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace satp::db::memory
