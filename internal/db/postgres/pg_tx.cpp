#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace graphvc::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      GRAPHVC_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw std::runtime_error("transaction already finished");
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace graphvc::db::postgres
