#pragma once

namespace graphvc::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Key locks taken through Repository::LockKey are held
    until Commit() / Rollback()

  SQLite: BEGIN IMMEDIATE, one writer per database
  Postgres: pqxx::work + pg_advisory_xact_lock
  Memory: read committed + append-only write set
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
