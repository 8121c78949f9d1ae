#pragma once

#include <optional>
#include <string>
#include <vector>

#include "graphvc/v1.hpp"
#include "service_context.hpp"

namespace graphvc::service {

/*
  Operation surface used by the CLI and embedders.

  Every call runs inside a span and logs failures before rethrowing;
  errors keep their util:: type (NotFound, Conflict, ValidationError).
*/
class GraphService {
 public:
  explicit GraphService(ServiceContext ctx);

  // branches
  graphvc::v1::Branch                      CreateBranch(const graphvc::v1::CreateBranchRequest& req);
  graphvc::v1::Branch                      GetBranch(const std::string& branch_id);
  std::vector<graphvc::v1::Branch>         ListBranches(const std::string& organization_id, const std::string& project_id);
  std::vector<graphvc::v1::BranchAncestor> Ancestors(const std::string& branch_id);

  // objects
  graphvc::v1::ObjectVersion                Write(const graphvc::v1::WriteObjectRequest& req);
  graphvc::v1::ObjectVersion                Patch(const graphvc::v1::PatchObjectRequest& req);
  graphvc::v1::ObjectVersion                Delete(const std::string& object_id);
  graphvc::v1::ObjectVersion                Restore(const std::string& object_id);
  graphvc::v1::ObjectVersion                Get(const std::string& object_id);
  graphvc::v1::HistoryResponse              History(const graphvc::v1::HistoryRequest& req);
  std::optional<graphvc::v1::ObjectVersion> Resolve(const std::string& branch_id, const std::string& canonical_id);

  // merge
  graphvc::v1::MergeSummary Merge(const graphvc::v1::MergeRequest& req);

  // provenance
  std::vector<graphvc::v1::MergeProvenanceEdge> ProvenanceParents(const std::string& version_id);
  std::vector<graphvc::v1::MergeProvenanceEdge> ProvenanceChildren(const std::string& version_id);

 private:
  ServiceContext ctx_;
};

} // namespace graphvc::service
