#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace satp::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  RAII owner of the sqlite3 handle.

  One handle is shared by every transaction; the connection is opened
  FULLMUTEX and BEGIN IMMEDIATE serializes writers.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // pragmas, DDL and transaction control
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace satp::db::sqlite
