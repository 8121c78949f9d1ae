#include "sqlite_db.hpp"

#include <algorithm>
#include <stdexcept>

namespace graphvc::db::sqlite {

namespace {

// first line of a statement, for error messages
std::string Head(const std::string& sql) {
  const auto end = sql.find_first_of("(\n");
  return sql.substr(0, std::min<std::size_t>(end, 80));
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const std::string filename = InMemory() ? ":memory:" : path_;

  const int rc = sqlite3_open_v2(filename.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open sqlite database " + filename + ": " + msg);
  }

  try {
    Configure(busy_timeout);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec '" + Head(sql) + "': " + msg);
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // version rows reference branches, provenance references versions
  Exec("PRAGMA foreign_keys=ON;");

  if (!InMemory()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace graphvc::db::sqlite
