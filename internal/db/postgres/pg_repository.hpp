#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace satp::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) override;
  Result DeleteSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&, bool include_terminal) override;

  Result InsertAudit(Transaction&, const model::SessionAuditRecord&) override;
  std::vector<model::SessionAuditRecord> GetAuditTrail(Transaction&, const std::string&) override;

  static void BootstrapSchema(PgPool& pool);

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace satp::db::postgres
