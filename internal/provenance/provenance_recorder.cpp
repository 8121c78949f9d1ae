#include "internal/provenance/provenance_recorder.hpp"

#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphvc::provenance {

using graphvc::v1::ProvenanceRole;

ProvenanceRecorder::ProvenanceRecorder(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string ProvenanceRecorder::RoleName(ProvenanceRole role) {
  switch (role) {
    case graphvc::v1::PROVENANCE_ROLE_TARGET:
      return "target";
    case graphvc::v1::PROVENANCE_ROLE_SOURCE:
      return "source";
    case graphvc::v1::PROVENANCE_ROLE_BASE:
      return "base";
    default:
      return "unspecified";
  }
}

ProvenanceRole ProvenanceRecorder::ParseRole(const std::string& name) {
  if (name == "target") return graphvc::v1::PROVENANCE_ROLE_TARGET;
  if (name == "source") return graphvc::v1::PROVENANCE_ROLE_SOURCE;
  if (name == "base") return graphvc::v1::PROVENANCE_ROLE_BASE;
  return graphvc::v1::PROVENANCE_ROLE_UNSPECIFIED;
}

graphvc::v1::MergeProvenanceEdge ProvenanceRecorder::ToProto(const db::model::MergeProvenanceRecord& record) {
  graphvc::v1::MergeProvenanceEdge edge;
  edge.set_child_version_id(record.child_version_id);
  edge.set_parent_version_id(record.parent_version_id);
  edge.set_role(ParseRole(record.role));
  *edge.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return edge;
}

void ProvenanceRecorder::Record(db::Transaction& tx, const std::string& child_version_id, const std::string& parent_version_id,
                                ProvenanceRole role) {
  if (child_version_id.empty() || parent_version_id.empty()) {
    throw util::ValidationError("provenance edge requires child and parent version ids");
  }
  if (child_version_id == parent_version_id) {
    throw util::ValidationError("provenance edge cannot point at itself: " + child_version_id);
  }
  if (role == graphvc::v1::PROVENANCE_ROLE_UNSPECIFIED) {
    throw util::ValidationError("provenance edge requires a role");
  }

  db::model::MergeProvenanceRecord record;
  record.child_version_id  = child_version_id;
  record.parent_version_id = parent_version_id;
  record.role              = RoleName(role);
  record.created_at_ms     = util::NowMillis();
  util::ThrowIfDbError(repository_->InsertMergeProvenance(tx, record), "insert merge provenance");
}

std::vector<graphvc::v1::MergeProvenanceEdge> ProvenanceRecorder::Parents(const std::string& version_id) {
  auto tx    = repository_->Begin();
  auto edges = Parents(*tx, version_id);
  tx->Commit();
  return edges;
}

std::vector<graphvc::v1::MergeProvenanceEdge> ProvenanceRecorder::Parents(db::Transaction& tx, const std::string& version_id) {
  std::vector<graphvc::v1::MergeProvenanceEdge> out;
  for (const auto& record : repository_->GetProvenanceParents(tx, version_id)) out.push_back(ToProto(record));
  return out;
}

std::vector<graphvc::v1::MergeProvenanceEdge> ProvenanceRecorder::Children(const std::string& version_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->GetProvenanceChildren(*tx, version_id);
  tx->Commit();

  std::vector<graphvc::v1::MergeProvenanceEdge> out;
  for (const auto& record : records) out.push_back(ToProto(record));
  return out;
}

} // namespace graphvc::provenance
