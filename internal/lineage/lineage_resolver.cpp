#include "internal/lineage/lineage_resolver.hpp"

#include <map>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace graphvc::lineage {

using graphvc::observability::IntField;
using graphvc::observability::StringField;

LineageResolver::LineageResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

graphvc::v1::Branch LineageResolver::ToProto(const db::model::BranchRecord& record) {
  graphvc::v1::Branch branch;
  branch.set_id(record.id);
  branch.set_name(record.name);
  branch.set_organization_id(record.organization_id);
  branch.set_project_id(record.project_id);
  branch.set_parent_branch_id(record.parent_branch_id);
  *branch.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return branch;
}

graphvc::v1::Branch LineageResolver::CreateBranch(const graphvc::v1::CreateBranchRequest& request) {
  if (request.organization_id().empty() || request.project_id().empty()) {
    throw util::ValidationError("branch requires organization_id and project_id");
  }
  if (request.name().empty()) {
    throw util::ValidationError("branch name must not be empty");
  }

  auto tx = repository_->Begin();
  util::ThrowIfDbError(repository_->LockKey(*tx, "branch|" + request.organization_id() + "|" + request.project_id() + "|" + request.name()),
                       "lock branch name");

  std::vector<db::model::BranchLineageRecord> parent_lineage;
  if (!request.parent_branch_id().empty()) {
    auto parent = repository_->GetBranch(*tx, request.parent_branch_id());
    if (!parent) {
      throw util::NotFound("parent branch not found: " + request.parent_branch_id());
    }
    if (parent->organization_id != request.organization_id() || parent->project_id != request.project_id()) {
      throw util::ValidationError("parent branch belongs to another project");
    }
    parent_lineage = repository_->GetBranchAncestors(*tx, parent->id);
  }

  if (repository_->GetBranchByName(*tx, request.organization_id(), request.project_id(), request.name())) {
    throw util::Conflict("branch name already exists: " + request.name());
  }

  db::model::BranchRecord record;
  record.id               = util::NewId();
  record.organization_id  = request.organization_id();
  record.project_id       = request.project_id();
  record.name             = request.name();
  record.parent_branch_id = request.parent_branch_id();
  record.created_at_ms    = util::NowMillis();
  util::ThrowIfDbError(repository_->InsertBranch(*tx, record), "insert branch");

  db::model::BranchLineageRecord self;
  self.branch_id          = record.id;
  self.ancestor_branch_id = record.id;
  self.depth              = 0;
  self.created_at_ms      = record.created_at_ms;
  util::ThrowIfDbError(repository_->InsertBranchLineage(*tx, self), "insert branch lineage");

  for (const auto& inherited : parent_lineage) {
    db::model::BranchLineageRecord edge;
    edge.branch_id          = record.id;
    edge.ancestor_branch_id = inherited.ancestor_branch_id;
    edge.depth              = inherited.depth + 1;
    edge.created_at_ms      = record.created_at_ms;
    util::ThrowIfDbError(repository_->InsertBranchLineage(*tx, edge), "insert branch lineage");
  }

  tx->Commit();

  GRAPHVC_LOG_INFO("branch created", {StringField("branch_id", record.id), StringField("name", record.name),
                                      StringField("parent_branch_id", record.parent_branch_id),
                                      IntField("ancestors", static_cast<int64_t>(parent_lineage.size() + 1))});
  return ToProto(record);
}

std::optional<graphvc::v1::Branch> LineageResolver::GetBranch(const std::string& branch_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBranch(*tx, branch_id);
  tx->Commit();
  if (!record) return std::nullopt;
  return ToProto(*record);
}

std::vector<graphvc::v1::Branch> LineageResolver::ListBranches(const std::string& organization_id, const std::string& project_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBranches(*tx, organization_id, project_id);
  tx->Commit();

  std::vector<graphvc::v1::Branch> out;
  out.reserve(records.size());
  for (const auto& r : records) out.push_back(ToProto(r));
  return out;
}

std::vector<graphvc::v1::BranchAncestor> LineageResolver::Ancestors(const std::string& branch_id) {
  auto tx      = repository_->Begin();
  auto lineage = Ancestors(*tx, branch_id);
  tx->Commit();

  if (lineage.empty()) {
    throw util::NotFound("branch not found: " + branch_id);
  }

  std::vector<graphvc::v1::BranchAncestor> out;
  out.reserve(lineage.size());
  for (const auto& edge : lineage) {
    graphvc::v1::BranchAncestor ancestor;
    ancestor.set_branch_id(edge.ancestor_branch_id);
    ancestor.set_depth(edge.depth);
    out.push_back(std::move(ancestor));
  }
  return out;
}

std::optional<db::model::ObjectVersionRecord> LineageResolver::Resolve(const std::string& branch_id, const std::string& canonical_id) {
  auto tx   = repository_->Begin();
  auto head = Resolve(*tx, branch_id, canonical_id);
  tx->Commit();
  return head;
}

std::optional<std::string> LineageResolver::NearestCommonAncestor(const std::string& a, const std::string& b) {
  auto tx     = repository_->Begin();
  auto common = NearestCommonAncestor(*tx, a, b);
  tx->Commit();
  return common;
}

std::vector<db::model::BranchLineageRecord> LineageResolver::Ancestors(db::Transaction& tx, const std::string& branch_id) {
  return repository_->GetBranchAncestors(tx, branch_id);
}

std::optional<db::model::ObjectVersionRecord> LineageResolver::ResolveRow(db::Transaction& tx, const std::string& branch_id,
                                                                          const std::string& canonical_id) {
  // the nearest branch holding any version decides
  for (const auto& edge : repository_->GetBranchAncestors(tx, branch_id)) {
    if (auto latest = repository_->GetLatestOnBranch(tx, canonical_id, edge.ancestor_branch_id)) return latest;
  }
  return std::nullopt;
}

std::optional<db::model::ObjectVersionRecord> LineageResolver::Resolve(db::Transaction& tx, const std::string& branch_id,
                                                                       const std::string& canonical_id) {
  auto row = ResolveRow(tx, branch_id, canonical_id);
  if (!row || row->IsTombstone()) return std::nullopt;
  return row;
}

/*
  Diamond tie-break: among common ancestors prefer the one with the
  largest ancestor set (deepest in the tree), then the smaller summed
  depth from both sides, then the smaller branch id.
*/
std::optional<std::string> LineageResolver::NearestCommonAncestor(db::Transaction& tx, const std::string& a, const std::string& b) {
  std::map<std::string, uint32_t> depth_a;
  for (const auto& edge : repository_->GetBranchAncestors(tx, a)) depth_a[edge.ancestor_branch_id] = edge.depth;

  std::optional<std::string>                          best;
  std::tuple<std::size_t, uint64_t>                   best_rank{0, 0};
  for (const auto& edge : repository_->GetBranchAncestors(tx, b)) {
    auto it = depth_a.find(edge.ancestor_branch_id);
    if (it == depth_a.end()) continue;

    const auto cardinality = repository_->GetBranchAncestors(tx, edge.ancestor_branch_id).size();
    const auto summed      = static_cast<uint64_t>(it->second) + edge.depth;

    const bool better = !best || cardinality > std::get<0>(best_rank) ||
                        (cardinality == std::get<0>(best_rank) && summed < std::get<1>(best_rank)) ||
                        (cardinality == std::get<0>(best_rank) && summed == std::get<1>(best_rank) && edge.ancestor_branch_id < *best);
    if (better) {
      best      = edge.ancestor_branch_id;
      best_rank = {cardinality, summed};
    }
  }
  return best;
}

} // namespace graphvc::lineage
