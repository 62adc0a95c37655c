#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace satp::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) override;
  Result DeleteSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&, bool include_terminal) override;

  Result InsertAudit(Transaction&, const model::SessionAuditRecord&) override;
  std::vector<model::SessionAuditRecord> GetAuditTrail(Transaction&, const std::string&) override;

  // Creates tables if missing. Idempotent.
  static void BootstrapSchema(SqliteDB& db);

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                tx_mutex_;
};

} // namespace satp::db::sqlite
