#include "memory_tx.hpp"

#include <stdexcept>

namespace graphvc::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::HoldKey(const std::string& key) {
  if (held_keys_.contains(key)) return;
  held_keys_.emplace(key, repo_.key_locks_.Acquire(key));
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("transaction already finished");
  }

  {
    std::scoped_lock lock(repo_.mutex_);
    const auto violation = MemoryRepository::FindViolation(repo_.committed_, pending_);
    if (!violation.empty()) {
      throw std::runtime_error("transaction conflict: " + violation);
    }

    auto& c = repo_.committed_;
    c.branches.insert(c.branches.end(), pending_.branches.begin(), pending_.branches.end());
    c.lineage.insert(c.lineage.end(), pending_.lineage.begin(), pending_.lineage.end());
    c.versions.insert(c.versions.end(), pending_.versions.begin(), pending_.versions.end());
    c.provenance.insert(c.provenance.end(), pending_.provenance.begin(), pending_.provenance.end());
  }

  pending_   = {};
  committed_ = true;
  ReleaseKeys();
}

void MemoryTransaction::Rollback() {
  pending_     = {};
  rolled_back_ = true;
  ReleaseKeys();
}

void MemoryTransaction::ReleaseKeys() {
  held_keys_.clear();
}

} // namespace graphvc::db::memory
