#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace satp::db::postgres {

class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  // declared first so the work is destroyed before its connection returns
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              committed_ = false;
};

} // namespace satp::db::postgres
