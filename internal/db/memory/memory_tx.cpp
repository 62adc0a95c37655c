#include "memory_tx.hpp"

namespace satp::db::memory {

bool MemoryTransaction::SameRow(const MemoryRepository::State& a, const MemoryRepository::State& b, const std::string& id) {
  auto lhs = a.sessions.find(id);
  auto rhs = b.sessions.find(id);
  if (lhs == a.sessions.end() || rhs == b.sessions.end()) {
    return (lhs == a.sessions.end()) == (rhs == b.sessions.end());
  }
  return lhs->second.version == rhs->second.version;
}

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_ = repo_.committed_;
  working_  = snapshot_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : touched_sessions_) {
    if (!SameRow(repo_.committed_, snapshot_, id)) {
      throw db::TransactionConflict("transaction conflict: session " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& id : touched_sessions_) {
    auto it = working_.sessions.find(id);
    if (it == working_.sessions.end()) {
      repo_.committed_.sessions.erase(id);
    } else {
      repo_.committed_.sessions[id] = it->second;
    }
  }

  // audit is append-only, so only the entries added here are merged
  for (const auto& id : touched_audit_) {
    const auto  base  = snapshot_.audit.contains(id) ? snapshot_.audit.at(id).size() : 0;
    const auto& added = working_.audit[id];
    auto&       dest  = repo_.committed_.audit[id];
    dest.insert(dest.end(), added.begin() + static_cast<std::ptrdiff_t>(base), added.end());
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace satp::db::memory
