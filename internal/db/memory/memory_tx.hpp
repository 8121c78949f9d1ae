#pragma once

#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "internal/lock/key_lock_table.hpp"
#include "memory_repository.hpp"

namespace graphvc::db::memory {

/*
  Transaction = read committed + buffered write set + held key locks.

  Reads see committed rows followed by this transaction's own rows.
  Commit re-checks unique keys and appends the write set atomically.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Pending() {
    return pending_;
  }
  const MemoryRepository::State& Pending() const {
    return pending_;
  }

  // Blocks on the repository key table unless this transaction already holds the key.
  void HoldKey(const std::string& key);

 private:
  void ReleaseKeys();

  MemoryRepository&                                          repo_;
  MemoryRepository::State                                    pending_;
  std::unordered_map<std::string, lock::KeyLockTable::Guard> held_keys_;
  bool                                                       committed_   = false;
  bool                                                       rolled_back_ = false;
};

} // namespace graphvc::db::memory
