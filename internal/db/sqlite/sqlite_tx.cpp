#include "sqlite_tx.hpp"

namespace satp::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& tx_mutex) : db_(std::move(db)), lock_(tx_mutex) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // nothing useful can be done with a failed rollback during unwind
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace satp::db::sqlite
