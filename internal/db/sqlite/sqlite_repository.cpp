#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/model/session.hpp"

namespace satp::db::sqlite {

using satp::db::ErrorCode;
using satp::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.session_id    = ColText(st, 0);
  r.stage         = static_cast<uint32_t>(sqlite3_column_int(st, 1));
  r.status        = static_cast<uint32_t>(sqlite3_column_int(st, 2));
  r.version       = ColU64(st, 3);
  r.updated_at_ms = ColU64(st, 4);
  r.data          = ColText(st, 5);
  return r;
}

constexpr const char* kSelectSession = "SELECT session_id,stage,status,version,updated_at_ms,data FROM satp_session";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS satp_session ("
      "session_id TEXT PRIMARY KEY, stage INTEGER NOT NULL, status INTEGER NOT NULL, "
      "version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, data TEXT NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS satp_session_status_idx ON satp_session(status);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS satp_session_audit ("
      "seq INTEGER PRIMARY KEY AUTOINCREMENT, session_id TEXT NOT NULL, status INTEGER NOT NULL, "
      "stage INTEGER NOT NULL, last_error TEXT, data TEXT NOT NULL, recorded_at_ms INTEGER NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS satp_session_audit_session_idx ON satp_session_audit(session_id);");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, tx_mutex_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare("INSERT INTO satp_session(session_id,stage,status,version,updated_at_ms,data) VALUES(?,?,?,?,?,?);");

  BindText(st.get(), 1, r.session_id);
  BindU64(st.get(), 2, r.stage);
  BindU64(st.get(), 3, r.status);
  BindU64(st.get(), 4, r.version);
  BindU64(st.get(), 5, r.updated_at_ms);
  BindText(st.get(), 6, r.data);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(std::string(kSelectSession) + " WHERE session_id=?;");
  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ReadSession(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error("get session " + id + ": " + Translate(db.Handle(), rc).message);
  return std::nullopt;
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r, uint64_t expected_version) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare("UPDATE satp_session SET stage=?,status=?,version=?,updated_at_ms=?,data=? WHERE session_id=? AND version=?;");

  BindU64(st.get(), 1, r.stage);
  BindU64(st.get(), 2, r.status);
  BindU64(st.get(), 3, r.version);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.data);
  BindText(st.get(), 6, r.session_id);
  BindU64(st.get(), 7, expected_version);

  auto res = Translate(db.Handle(), sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db.Handle()) == 1) return Result::Ok();

  // zero rows: either missing or a different version
  if (!GetSession(t, r.session_id)) return Result::Err(ErrorCode::NotFound, r.session_id);
  return Result::Err(ErrorCode::Conflict, "version mismatch for session " + r.session_id);
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare("DELETE FROM satp_session WHERE session_id=?;");
  BindText(st.get(), 1, id);

  auto res = Translate(db.Handle(), sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t, bool include_terminal) {
  auto& db  = TX(t).DB();
  auto  sql = std::string(kSelectSession);
  if (!include_terminal) {
    sql += " WHERE status NOT IN (" + std::to_string(static_cast<int>(satp::model::SessionStatus::kSuccess)) + "," +
           std::to_string(static_cast<int>(satp::model::SessionStatus::kFailed)) + "," +
           std::to_string(static_cast<int>(satp::model::SessionStatus::kRolledBack)) + ")";
  }
  sql += " ORDER BY updated_at_ms;";

  auto                              st = db.Prepare(sql);
  std::vector<model::SessionRecord> records;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    records.push_back(ReadSession(st.get()));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("list sessions: " + Translate(db.Handle(), rc).message);
  return records;
}

Result SqliteRepository::InsertAudit(Transaction& t, const model::SessionAuditRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare("INSERT INTO satp_session_audit(session_id,status,stage,last_error,data,recorded_at_ms) VALUES(?,?,?,?,?,?);");

  BindText(st.get(), 1, r.session_id);
  BindU64(st.get(), 2, r.status);
  BindU64(st.get(), 3, r.stage);
  BindText(st.get(), 4, r.last_error);
  BindText(st.get(), 5, r.data);
  BindU64(st.get(), 6, r.recorded_at_ms);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::vector<model::SessionAuditRecord> SqliteRepository::GetAuditTrail(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare("SELECT session_id,status,stage,last_error,data,recorded_at_ms FROM satp_session_audit WHERE session_id=? ORDER BY seq;");
  BindText(st.get(), 1, id);

  std::vector<model::SessionAuditRecord> records;
  int                                    rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::SessionAuditRecord r;
    r.session_id     = ColText(st.get(), 0);
    r.status         = static_cast<uint32_t>(sqlite3_column_int(st.get(), 1));
    r.stage          = static_cast<uint32_t>(sqlite3_column_int(st.get(), 2));
    r.last_error     = ColText(st.get(), 3);
    r.data           = ColText(st.get(), 4);
    r.recorded_at_ms = ColU64(st.get(), 5);
    records.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error("audit trail " + id + ": " + Translate(db.Handle(), rc).message);
  return records;
}

} // namespace satp::db::sqlite
