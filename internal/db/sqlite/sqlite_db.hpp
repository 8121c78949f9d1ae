#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace graphvc::db::sqlite {

/*
  Owns the single sqlite3* connection of a graphvc database file.

  The connection is shared by every transaction, so transactions are
  serialized on WriterMutex() for their whole lifetime. Other processes
  opening the same file wait up to `busy_timeout` for its lock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // ":memory:" and "" open a private in-memory database
  bool InMemory() const {
    return path_.empty() || path_ == ":memory:";
  }

  // Runs one or more statements without results (pragmas, schema).
  void Exec(const std::string& sql);

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace graphvc::db::sqlite
