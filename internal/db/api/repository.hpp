#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/session_record.hpp"

namespace satp::db {

/*
  Session repository.

  - All access goes through a Transaction.
  - UpdateSession is a compare-and-swap on version: it returns Conflict
    when the stored version differs from expected_version.
  - The audit table is append-only.
*/
class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;
  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;
  virtual Result UpdateSession(Transaction&, const model::SessionRecord&, uint64_t expected_version) = 0;
  virtual Result DeleteSession(Transaction&, const std::string& session_id) = 0;

  // terminal sessions are skipped unless include_terminal is set
  virtual std::vector<model::SessionRecord> ListSessions(Transaction&, bool include_terminal) = 0;

  virtual Result InsertAudit(Transaction&, const model::SessionAuditRecord&) = 0;
  virtual std::vector<model::SessionAuditRecord> GetAuditTrail(Transaction&, const std::string& session_id) = 0;
};

// status numbers that end a session (satp.gateway.v1.SessionStatus)
bool IsTerminalStatus(uint32_t status);

} // namespace satp::db
