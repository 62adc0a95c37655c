#include "pg_pool.hpp"

namespace satp::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_session",
               "SELECT session_id, stage, status, version, updated_at_ms, data "
               "FROM satp_session WHERE session_id=$1");

  conn.prepare("insert_session",
               "INSERT INTO satp_session(session_id,stage,status,version,updated_at_ms,data) "
               "VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("update_session",
               "UPDATE satp_session SET stage=$2,status=$3,version=$4,updated_at_ms=$5,data=$6 "
               "WHERE session_id=$1 AND version=$7");

  conn.prepare("delete_session", "DELETE FROM satp_session WHERE session_id=$1");

  conn.prepare("list_sessions",
               "SELECT session_id, stage, status, version, updated_at_ms, data "
               "FROM satp_session ORDER BY updated_at_ms");

  conn.prepare("list_open_sessions",
               "SELECT session_id, stage, status, version, updated_at_ms, data "
               "FROM satp_session WHERE status NOT IN (2,3,4) ORDER BY updated_at_ms");

  conn.prepare("insert_audit",
               "INSERT INTO satp_session_audit(session_id,status,stage,last_error,data,recorded_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6)");

  conn.prepare("get_audit",
               "SELECT session_id, status, stage, last_error, data, recorded_at_ms "
               "FROM satp_session_audit WHERE session_id=$1 ORDER BY seq");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
      delete conn;
    }
  }
  cv_.notify_one();
}

} // namespace satp::db::postgres
