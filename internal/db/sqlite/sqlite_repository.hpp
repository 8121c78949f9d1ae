#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace graphvc::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  // transactions are already serialized on the connection
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

  // CREATE TABLE IF NOT EXISTS for every table above
  static void BootstrapSchema(SqliteDB& db);

 private:
  static SqliteTransaction& TX(Transaction&);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace graphvc::db::sqlite
