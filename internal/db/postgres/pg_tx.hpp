#pragma once

#include <memory>

#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace shortener::db::postgres {

/*
  One pqxx::work on a pooled connection.

  The connection goes back to the pool when the transaction is destroyed,
  after the work has been committed or aborted. A duplicate short code is
  reported by the unique index at insert time, never at Commit().
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              committed_ = false;
  bool                              finished_  = false;
};

} // namespace shortener::db::postgres
