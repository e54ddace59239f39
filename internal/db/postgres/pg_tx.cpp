#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace shortener::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      work_->abort();
    } catch (const std::exception& e) {
      SHORTENER_LOG_WARN("postgres rollback failed", {shortener::observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  work_.reset();
}

void PgTransaction::Commit() {
  work_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  work_->abort();
}

} // namespace shortener::db::postgres
