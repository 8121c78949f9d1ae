#pragma once

#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/lock/key_lock_table.hpp"

namespace graphvc::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  Result LockKey(Transaction&, const std::string& key) override;

  Result InsertBranch(Transaction&, const model::BranchRecord&) override;
  std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string&) override;
  std::optional<model::BranchRecord> GetBranchByName(Transaction&, const std::string& organization_id,
                                                     const std::string& project_id, const std::string& name) override;
  std::vector<model::BranchRecord> ListBranches(Transaction&, const std::string& organization_id,
                                                const std::string& project_id) override;

  Result InsertBranchLineage(Transaction&, const model::BranchLineageRecord&) override;
  std::vector<model::BranchLineageRecord> GetBranchAncestors(Transaction&, const std::string& branch_id) override;

  Result InsertObjectVersion(Transaction&, const model::ObjectVersionRecord&) override;
  std::optional<model::ObjectVersionRecord> GetObjectVersion(Transaction&, const std::string&) override;
  std::optional<model::ObjectVersionRecord> GetLatestOnBranch(Transaction&, const std::string& canonical_id,
                                                              const std::string& branch_id) override;
  uint64_t GetMaxVersion(Transaction&, const std::string& canonical_id) override;
  std::vector<model::ObjectVersionRecord> ListVersions(Transaction&, const std::string& canonical_id,
                                                       uint64_t before_version, std::size_t limit) override;
  std::vector<std::string> FindCanonicalIds(Transaction&, const std::string& project_id, const std::string& type,
                                            const std::string& key) override;
  std::vector<std::string> ListCanonicalIdsOnBranches(Transaction&, const std::vector<std::string>& branch_ids) override;

  Result InsertMergeProvenance(Transaction&, const model::MergeProvenanceRecord&) override;
  std::vector<model::MergeProvenanceRecord> GetProvenanceParents(Transaction&, const std::string&) override;
  std::vector<model::MergeProvenanceRecord> GetProvenanceChildren(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  // Append-only row sets; a transaction buffers its own rows in the same shape.
  struct State {
    std::vector<model::BranchRecord>          branches;
    std::vector<model::BranchLineageRecord>   lineage;
    std::vector<model::ObjectVersionRecord>   versions;
    std::vector<model::MergeProvenanceRecord> provenance;
  };

  // Unique-key checks of `pending` rows against `committed`; empty when clean.
  static std::string FindViolation(const State& committed, const State& pending);

  std::mutex mutex_;
  State committed_;

  lock::KeyLockTable key_locks_;
};

}
