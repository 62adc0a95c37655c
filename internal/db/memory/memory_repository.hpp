#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace satp::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) override;
  Result DeleteSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&, bool include_terminal) override;

  Result InsertAudit(Transaction&, const model::SessionAuditRecord&) override;
  std::vector<model::SessionAuditRecord> GetAuditTrail(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::SessionRecord>                    sessions;
    std::map<std::string, std::vector<model::SessionAuditRecord>> audit;
  };

  std::mutex mutex_;
  State      committed_;
};

} // namespace satp::db::memory
