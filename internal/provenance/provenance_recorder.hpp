#pragma once

#include <memory>
#include <string>
#include <vector>

#include "graphvc/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace graphvc::provenance {

/*
  Append-only writer of merge provenance edges plus audit queries.

  Edges are written only inside a merge-execute transaction and are
  never updated or deleted.
*/
class ProvenanceRecorder {
 public:
  explicit ProvenanceRecorder(std::shared_ptr<db::Repository> repository);

  void Record(db::Transaction& tx, const std::string& child_version_id, const std::string& parent_version_id, graphvc::v1::ProvenanceRole role);

  // versions that contributed to `version_id`
  std::vector<graphvc::v1::MergeProvenanceEdge> Parents(const std::string& version_id);

  // merged versions `version_id` contributed to
  std::vector<graphvc::v1::MergeProvenanceEdge> Children(const std::string& version_id);

  std::vector<graphvc::v1::MergeProvenanceEdge> Parents(db::Transaction& tx, const std::string& version_id);

  static std::string                 RoleName(graphvc::v1::ProvenanceRole role);
  static graphvc::v1::ProvenanceRole ParseRole(const std::string& name);

 private:
  static graphvc::v1::MergeProvenanceEdge ToProto(const db::model::MergeProvenanceRecord& record);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace graphvc::provenance
