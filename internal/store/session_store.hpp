#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/session.hpp"

namespace satp::store {

/*
  SessionStore

  Durable SessionData keyed by session id. The store is the single source
  of truth; every write is one repository transaction.

  Errors:
    util::NotFound           unknown session
    util::InvalidStateError  version conflict, or write to a terminal session
    util::PersistenceError   anything the backend could not do

  Writes bump version and updated_at_ms. A write that makes the session
  terminal also appends the audit entry in the same transaction.
*/
class SessionStore {
 public:
  explicit SessionStore(std::shared_ptr<db::Repository> repository);

  model::SessionData                Get(const std::string& session_id);
  std::optional<model::SessionData> Find(const std::string& session_id);

  // Insert when absent (session.version must be 0), otherwise compare-and-swap
  // on session.version. Returns the stored copy.
  model::SessionData Put(const model::SessionData& session);

  // Read-modify-write inside one transaction.
  model::SessionData Update(const std::string& session_id, const std::function<void(model::SessionData&)>& fn);

  // Only terminal sessions with an audit entry may be deleted.
  void Delete(const std::string& session_id);

  std::vector<model::SessionData> ListNonTerminal();
  std::vector<model::SessionData> List(bool include_terminal);

  // Appends another audit entry for a stored terminal session. Terminal
  // writes already audit themselves.
  void                            RecordAudit(const model::SessionData& session);
  std::vector<model::SessionData> AuditTrail(const std::string& session_id);

 private:
  model::SessionData Write(db::Transaction& tx, const std::optional<db::model::SessionRecord>& existing, model::SessionData next);
  void               AppendAudit(db::Transaction& tx, const db::model::SessionRecord& record, const std::string& last_error);

  template <typename Fn>
  auto Run(const std::string& context, Fn&& fn);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace satp::store
