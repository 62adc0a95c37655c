#include "pg_repository.hpp"

namespace satp::db::postgres {

namespace {

model::SessionRecord ReadSession(const pqxx::row& row) {
  model::SessionRecord r;
  r.session_id    = row[0].c_str();
  r.stage         = row[1].as<uint32_t>();
  r.status        = row[2].as<uint32_t>();
  r.version       = row[3].as<uint64_t>();
  r.updated_at_ms = row[4].as<uint64_t>();
  r.data          = row[5].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS satp_session (session_id TEXT PRIMARY KEY, stage SMALLINT NOT NULL, "
      "status SMALLINT NOT NULL, version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, data JSONB NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS satp_session_status_idx ON satp_session(status);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS satp_session_audit (seq BIGSERIAL PRIMARY KEY, session_id TEXT NOT NULL, "
      "status SMALLINT NOT NULL, stage SMALLINT NOT NULL, last_error TEXT, data JSONB NOT NULL, recorded_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS satp_session_audit_session_idx ON satp_session_audit(session_id);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_session", r.session_id, r.stage, r.status, r.version, r.updated_at_ms, r.data);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

Result PgRepository::UpdateSession(Transaction& t, const model::SessionRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_session", r.session_id, r.stage, r.status, r.version, r.updated_at_ms, r.data, expected_version);
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetSession(t, r.session_id)) return Result::Err(ErrorCode::NotFound, r.session_id);
  return Result::Err(ErrorCode::Conflict, "version mismatch for session " + r.session_id);
}

Result PgRepository::DeleteSession(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_session", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SessionRecord> PgRepository::ListSessions(Transaction& t, bool include_terminal) {
  auto res = TX(t).Work().exec_prepared(include_terminal ? "list_sessions" : "list_open_sessions");

  std::vector<model::SessionRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadSession(row));
  }
  return records;
}

Result PgRepository::InsertAudit(Transaction& t, const model::SessionAuditRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_audit", r.session_id, r.status, r.stage, r.last_error, r.data, r.recorded_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SessionAuditRecord> PgRepository::GetAuditTrail(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_audit", id);

  std::vector<model::SessionAuditRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    model::SessionAuditRecord r;
    r.session_id     = row[0].c_str();
    r.status         = row[1].as<uint32_t>();
    r.stage          = row[2].as<uint32_t>();
    r.last_error     = row[3].is_null() ? "" : row[3].c_str();
    r.data           = row[4].c_str();
    r.recorded_at_ms = row[5].as<uint64_t>();
    records.push_back(std::move(r));
  }
  return records;
}

} // namespace satp::db::postgres
