#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace satp::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN IMMEDIATE takes the write lock up front. The shared handle also
  needs in-process exclusion, so the transaction holds the DB's
  transaction mutex for its whole lifetime.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& tx_mutex);
  ~SqliteTransaction();

  SqliteDB& DB() const {
    return *db_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace satp::db::sqlite
