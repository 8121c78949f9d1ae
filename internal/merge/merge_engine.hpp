#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "graphvc/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace graphvc::lineage {
class LineageResolver;
}
namespace graphvc::provenance {
class ProvenanceRecorder;
}
namespace graphvc::store {
class ObjectStore;
}

namespace graphvc::merge {

/*
  Branch merge: classifies every canonical object reachable from the
  source or target branch as Added, FastForward, Conflict or Unchanged.

  Classification is per object against the nearest common ancestor in
  the version graph (supersedes links plus merge provenance parents).
  Two sides fast-forward when their changed property paths relative to
  that base do not overlap.

  Execute applies Added and FastForward objects onto the target branch
  in one transaction; conflicts are reported, never applied.
*/
class MergeEngine {
 public:
  MergeEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<lineage::LineageResolver> lineage, std::shared_ptr<store::ObjectStore> store,
              std::shared_ptr<provenance::ProvenanceRecorder> provenance);

  graphvc::v1::MergeSummary Merge(const graphvc::v1::MergeRequest& request);

 private:
  struct Classification {
    graphvc::v1::ObjectMergeResult                result;
    std::optional<db::model::ObjectVersionRecord> target_head;
    std::optional<db::model::ObjectVersionRecord> source_head;
    std::optional<db::model::ObjectVersionRecord> base;
  };

  // nullopt when the object is absent on the source
  std::optional<Classification> Classify(db::Transaction& tx, const std::string& target_branch_id, const std::string& source_branch_id,
                                         const std::string& canonical_id);

  std::optional<db::model::ObjectVersionRecord> FindBaseVersion(db::Transaction& tx, const db::model::ObjectVersionRecord& a,
                                                                const db::model::ObjectVersionRecord& b);

  bool IsVersionAncestor(db::Transaction& tx, const std::string& ancestor_id, const db::model::ObjectVersionRecord& descendant);

  std::vector<std::string> VersionParents(db::Transaction& tx, const db::model::ObjectVersionRecord& version);

  // changed paths of `head` relative to `base`
  std::vector<std::string> PathsSince(const db::model::ObjectVersionRecord& head, const db::model::ObjectVersionRecord& base);

  // new version id
  std::string Apply(db::Transaction& tx, const std::string& target_branch_id, Classification& classification,
                    std::vector<db::model::ObjectVersionRecord>& written);

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<lineage::LineageResolver>       lineage_;
  std::shared_ptr<store::ObjectStore>             store_;
  std::shared_ptr<provenance::ProvenanceRecorder> provenance_;
};

} // namespace graphvc::merge
