#pragma once

#include <exception>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace graphvc::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  // pg_advisory_xact_lock(hashtext(key))
  Result LockKey(Transaction&, const std::string& key) override;

  Result                             InsertBranch(Transaction&, const model::BranchRecord&) override;
  std::optional<model::BranchRecord> GetBranch(Transaction&, const std::string& id) override;
  std::optional<model::BranchRecord> GetBranchByName(Transaction&, const std::string& organization_id, const std::string& project_id,
                                                     const std::string& name) override;
  std::vector<model::BranchRecord>   ListBranches(Transaction&, const std::string& organization_id, const std::string& project_id) override;

  Result                                  InsertBranchLineage(Transaction&, const model::BranchLineageRecord&) override;
  std::vector<model::BranchLineageRecord> GetBranchAncestors(Transaction&, const std::string& branch_id) override;

  Result                                    InsertObjectVersion(Transaction&, const model::ObjectVersionRecord&) override;
  std::optional<model::ObjectVersionRecord> GetObjectVersion(Transaction&, const std::string& id) override;
  std::optional<model::ObjectVersionRecord> GetLatestOnBranch(Transaction&, const std::string& canonical_id, const std::string& branch_id) override;
  uint64_t                                  GetMaxVersion(Transaction&, const std::string& canonical_id) override;
  std::vector<model::ObjectVersionRecord>   ListVersions(Transaction&, const std::string& canonical_id, uint64_t before_version,
                                                         std::size_t limit) override;
  std::vector<std::string> FindCanonicalIds(Transaction&, const std::string& project_id, const std::string& type, const std::string& key) override;
  std::vector<std::string> ListCanonicalIdsOnBranches(Transaction&, const std::vector<std::string>& branch_ids) override;

  Result                                    InsertMergeProvenance(Transaction&, const model::MergeProvenanceRecord&) override;
  std::vector<model::MergeProvenanceRecord> GetProvenanceParents(Transaction&, const std::string& child_version_id) override;
  std::vector<model::MergeProvenanceRecord> GetProvenanceChildren(Transaction&, const std::string& parent_version_id) override;

  static void BootstrapSchema(PgPool& pool);

 private:
  static PgTransaction& TX(Transaction&);
  static Result         Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace graphvc::db::postgres
