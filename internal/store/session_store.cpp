#include "internal/store/session_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/session_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace satp::store {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidStateError(message);
    default:
      throw util::PersistenceError(std::string(db::ErrorCodeName(result.code)) + ": " + message);
  }
}

db::model::SessionRecord ToRecord(const model::SessionData& session) {
  db::model::SessionRecord record;
  record.session_id    = session.session_id;
  record.stage         = static_cast<uint32_t>(session.stage);
  record.status        = static_cast<uint32_t>(session.status);
  record.version       = session.version;
  record.updated_at_ms = session.updated_at_ms;
  record.data          = ToJson(session);
  return record;
}

} // namespace

SessionStore::SessionStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

// Domain errors pass through; anything else from the backend is a PersistenceError.
template <typename Fn>
auto SessionStore::Run(const std::string& context, Fn&& fn) {
  try {
    return fn();
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::InvalidStateError&) {
    throw;
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const db::TransactionConflict& e) {
    throw util::InvalidStateError(context + ": " + e.what());
  } catch (const std::exception& e) {
    SATP_LOG_ERROR("session store failure", {observability::StringField("op", context), observability::StringField("error", e.what())});
    throw util::PersistenceError(context + ": " + e.what());
  }
}

model::SessionData SessionStore::Get(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    throw util::NotFound("session " + session_id + " not found");
  }
  return *session;
}

std::optional<model::SessionData> SessionStore::Find(const std::string& session_id) {
  return Run("get session " + session_id, [&]() -> std::optional<model::SessionData> {
    auto tx     = repository_->Begin();
    auto record = repository_->GetSession(*tx, session_id);
    tx->Commit();
    if (!record) return std::nullopt;
    return FromJson(record->data);
  });
}

model::SessionData SessionStore::Write(db::Transaction& tx, const std::optional<db::model::SessionRecord>& existing, model::SessionData next) {
  if (existing && db::IsTerminalStatus(existing->status)) {
    throw util::InvalidStateError("session " + next.session_id + " is terminal and immutable");
  }

  const auto expected = next.version;
  const auto now      = util::NowMillis();
  next.version        = expected + 1;
  next.updated_at_ms  = now;
  if (next.created_at_ms == 0) next.created_at_ms = now;
  if (model::IsTerminal(next.status) && next.completed_at_ms == 0) next.completed_at_ms = now;

  auto record = ToRecord(next);
  if (!existing) {
    if (expected != 0) {
      throw util::InvalidStateError("session " + next.session_id + " was expected at version " + std::to_string(expected) + " but is not stored");
    }
    ThrowIfDbError(repository_->InsertSession(tx, record), "insert session " + next.session_id);
  } else {
    ThrowIfDbError(repository_->UpdateSession(tx, record, expected), "update session " + next.session_id);
  }

  if (model::IsTerminal(next.status)) {
    AppendAudit(tx, record, next.last_error.message);
  }
  return next;
}

void SessionStore::AppendAudit(db::Transaction& tx, const db::model::SessionRecord& record, const std::string& last_error) {
  db::model::SessionAuditRecord audit;
  audit.session_id     = record.session_id;
  audit.status         = record.status;
  audit.stage          = record.stage;
  audit.last_error     = last_error;
  audit.data           = record.data;
  audit.recorded_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->InsertAudit(tx, audit), "audit session " + record.session_id);
}

void SessionStore::RecordAudit(const model::SessionData& session) {
  Run("audit session " + session.session_id, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetSession(*tx, session.session_id);
    if (!existing) {
      throw util::NotFound("session " + session.session_id + " not found");
    }
    if (!db::IsTerminalStatus(existing->status)) {
      throw util::InvalidStateError("session " + session.session_id + " is not terminal");
    }
    if (existing->version != session.version) {
      throw util::InvalidStateError("session " + session.session_id + " is at version " + std::to_string(existing->version));
    }

    // the stored copy is what gets audited
    AppendAudit(*tx, *existing, FromJson(existing->data).last_error.message);
    tx->Commit();
  });
}

model::SessionData SessionStore::Put(const model::SessionData& session) {
  return Run("put session " + session.session_id, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetSession(*tx, session.session_id);
    auto stored   = Write(*tx, existing, session);
    tx->Commit();
    return stored;
  });
}

model::SessionData SessionStore::Update(const std::string& session_id, const std::function<void(model::SessionData&)>& fn) {
  return Run("update session " + session_id, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetSession(*tx, session_id);
    if (!existing) {
      throw util::NotFound("session " + session_id + " not found");
    }

    auto session = FromJson(existing->data);
    fn(session);
    if (session.session_id != session_id) {
      throw util::InvalidStateError("session id is immutable: " + session_id);
    }
    session.version = existing->version;

    auto stored = Write(*tx, existing, std::move(session));
    tx->Commit();
    return stored;
  });
}

void SessionStore::Delete(const std::string& session_id) {
  Run("delete session " + session_id, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetSession(*tx, session_id);
    if (!existing) {
      throw util::NotFound("session " + session_id + " not found");
    }
    if (!db::IsTerminalStatus(existing->status)) {
      throw util::InvalidStateError("session " + session_id + " is still in progress");
    }
    if (repository_->GetAuditTrail(*tx, session_id).empty()) {
      throw util::InvalidStateError("session " + session_id + " has no audit entry");
    }
    ThrowIfDbError(repository_->DeleteSession(*tx, session_id), "delete session " + session_id);
    tx->Commit();
  });
}

std::vector<model::SessionData> SessionStore::ListNonTerminal() {
  return List(false);
}

std::vector<model::SessionData> SessionStore::List(bool include_terminal) {
  return Run("list sessions", [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->ListSessions(*tx, include_terminal);
    tx->Commit();

    std::vector<model::SessionData> sessions;
    sessions.reserve(records.size());
    for (const auto& record : records) {
      sessions.push_back(FromJson(record.data));
    }
    return sessions;
  });
}

std::vector<model::SessionData> SessionStore::AuditTrail(const std::string& session_id) {
  return Run("audit trail " + session_id, [&] {
    auto tx      = repository_->Begin();
    auto records = repository_->GetAuditTrail(*tx, session_id);
    tx->Commit();

    std::vector<model::SessionData> entries;
    entries.reserve(records.size());
    for (const auto& record : records) {
      entries.push_back(FromJson(record.data));
    }
    return entries;
  });
}

} // namespace satp::store
