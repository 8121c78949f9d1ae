#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "graphvc/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace graphvc::lineage {

/*
  Branch creation and ancestry.

  Lineage is a precomputed closure: a branch copies its parent's
  ancestor set with depth + 1 and adds itself at depth 0. Nothing
  in it changes after creation.

  Methods taking a Transaction run inside the caller's transaction.
*/
class LineageResolver {
 public:
  explicit LineageResolver(std::shared_ptr<db::Repository> repository);

  // NotFound for an unknown parent, Conflict for a duplicate name in the project.
  graphvc::v1::Branch CreateBranch(const graphvc::v1::CreateBranchRequest& request);

  std::optional<graphvc::v1::Branch> GetBranch(const std::string& branch_id);
  std::vector<graphvc::v1::Branch>   ListBranches(const std::string& organization_id, const std::string& project_id);

  // nearest first; NotFound for an unknown branch
  std::vector<graphvc::v1::BranchAncestor> Ancestors(const std::string& branch_id);

  // Live head of `canonical_id` as seen from `branch_id`. Never throws on
  // unknown ids: absence is the answer.
  std::optional<db::model::ObjectVersionRecord> Resolve(const std::string& branch_id, const std::string& canonical_id);

  std::optional<std::string> NearestCommonAncestor(const std::string& a, const std::string& b);

  // ------------------------------------------------------------------
  // transaction scoped
  // ------------------------------------------------------------------

  std::vector<db::model::BranchLineageRecord>   Ancestors(db::Transaction& tx, const std::string& branch_id);
  std::optional<db::model::ObjectVersionRecord> Resolve(db::Transaction& tx, const std::string& branch_id, const std::string& canonical_id);
  // deciding row, tombstones included
  std::optional<db::model::ObjectVersionRecord> ResolveRow(db::Transaction& tx, const std::string& branch_id, const std::string& canonical_id);
  std::optional<std::string>                    NearestCommonAncestor(db::Transaction& tx, const std::string& a, const std::string& b);

  static graphvc::v1::Branch ToProto(const db::model::BranchRecord& record);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace graphvc::lineage
