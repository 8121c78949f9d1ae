#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/branch_lineage_record.hpp"
#include "internal/db/model/branch_record.hpp"
#include "internal/db/model/merge_provenance_record.hpp"
#include "internal/db/model/object_version_record.hpp"

namespace graphvc::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Rows are append-only: nothing is updated or deleted
  - (canonical_id, version) is unique across all branches
  - LockKey blocks until the key is free and holds it until the
    transaction ends; re-locking a held key is a no-op

  The DB is the source of truth for:
    object versions
    branches and their lineage
    merge provenance
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Key-scoped write serialization ("obj|<canonical_id>", ...).
  virtual Result LockKey(Transaction&, const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Branches
  // ---------------------------------------------------------------------

  virtual Result InsertBranch(Transaction&, const model::BranchRecord&) = 0;

  virtual std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::BranchRecord> GetBranchByName(Transaction&, const std::string& organization_id, const std::string& project_id,
                                                             const std::string& name) = 0;

  // ordered by created_at, then name
  virtual std::vector<model::BranchRecord> ListBranches(Transaction&, const std::string& organization_id, const std::string& project_id) = 0;

  // ---------------------------------------------------------------------
  // Branch lineage
  // ---------------------------------------------------------------------

  virtual Result InsertBranchLineage(Transaction&, const model::BranchLineageRecord&) = 0;

  // nearest first (depth ascending); includes the self row
  virtual std::vector<model::BranchLineageRecord> GetBranchAncestors(Transaction&, const std::string& branch_id) = 0;

  // ---------------------------------------------------------------------
  // Object versions
  // ---------------------------------------------------------------------

  virtual Result InsertObjectVersion(Transaction&, const model::ObjectVersionRecord&) = 0;

  virtual std::optional<model::ObjectVersionRecord> GetObjectVersion(Transaction&, const std::string& id) = 0;

  // highest version of canonical_id written on exactly this branch
  virtual std::optional<model::ObjectVersionRecord> GetLatestOnBranch(Transaction&, const std::string& canonical_id, const std::string& branch_id) = 0;

  // 0 when the canonical object has no versions
  virtual uint64_t GetMaxVersion(Transaction&, const std::string& canonical_id) = 0;

  // newest first; before_version == 0 means unbounded, limit == 0 means all
  virtual std::vector<model::ObjectVersionRecord> ListVersions(Transaction&, const std::string& canonical_id, uint64_t before_version,
                                                               std::size_t limit) = 0;

  virtual std::vector<std::string> FindCanonicalIds(Transaction&, const std::string& project_id, const std::string& type, const std::string& key) = 0;

  // distinct canonical ids with at least one version on any of the branches, sorted
  virtual std::vector<std::string> ListCanonicalIdsOnBranches(Transaction&, const std::vector<std::string>& branch_ids) = 0;

  // ---------------------------------------------------------------------
  // Merge provenance
  // ---------------------------------------------------------------------

  virtual Result InsertMergeProvenance(Transaction&, const model::MergeProvenanceRecord&) = 0;

  virtual std::vector<model::MergeProvenanceRecord> GetProvenanceParents(Transaction&, const std::string& child_version_id) = 0;

  virtual std::vector<model::MergeProvenanceRecord> GetProvenanceChildren(Transaction&, const std::string& parent_version_id) = 0;
};

} // namespace graphvc::db
