#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace graphvc::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      GRAPHVC_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::runtime_error("transaction already finished");
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  writer_.unlock();
}

} // namespace graphvc::db::sqlite
