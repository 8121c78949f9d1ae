#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace graphvc::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the database writer mutex from construction until
  Commit() / Rollback(), and uses BEGIN IMMEDIATE so the file
  write lock is taken up front as well.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace graphvc::db::sqlite
