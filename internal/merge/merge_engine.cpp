#include "internal/merge/merge_engine.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "internal/diff/json_pointer.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provenance/provenance_recorder.hpp"
#include "internal/store/object_store.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace graphvc::merge {

using graphvc::observability::IntField;
using graphvc::observability::PathsField;
using graphvc::observability::StringField;
using graphvc::v1::MergeStatus;

namespace {

const char* StatusName(MergeStatus status) {
  switch (status) {
    case graphvc::v1::MERGE_STATUS_ADDED:
      return "added";
    case graphvc::v1::MERGE_STATUS_UNCHANGED:
      return "unchanged";
    case graphvc::v1::MERGE_STATUS_FAST_FORWARD:
      return "fast_forward";
    case graphvc::v1::MERGE_STATUS_CONFLICT:
      return "conflict";
    default:
      return "unspecified";
  }
}

std::vector<std::string> UnionLabels(std::vector<std::string> target, const std::vector<std::string>& source) {
  for (const auto& label : source) {
    if (std::find(target.begin(), target.end(), label) == target.end()) target.push_back(label);
  }
  return target;
}

void Count(graphvc::v1::MergeSummary& summary, MergeStatus status) {
  switch (status) {
    case graphvc::v1::MERGE_STATUS_ADDED:
      summary.set_added_count(summary.added_count() + 1);
      break;
    case graphvc::v1::MERGE_STATUS_FAST_FORWARD:
      summary.set_fast_forward_count(summary.fast_forward_count() + 1);
      break;
    case graphvc::v1::MERGE_STATUS_CONFLICT:
      summary.set_conflict_count(summary.conflict_count() + 1);
      break;
    case graphvc::v1::MERGE_STATUS_UNCHANGED:
      summary.set_unchanged_count(summary.unchanged_count() + 1);
      break;
    default:
      break;
  }
}

bool Applicable(MergeStatus status) {
  return status == graphvc::v1::MERGE_STATUS_ADDED || status == graphvc::v1::MERGE_STATUS_FAST_FORWARD;
}

} // namespace

MergeEngine::MergeEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<lineage::LineageResolver> lineage,
                         std::shared_ptr<store::ObjectStore> store, std::shared_ptr<provenance::ProvenanceRecorder> provenance)
    : repository_(std::move(repository)), lineage_(std::move(lineage)), store_(std::move(store)), provenance_(std::move(provenance)) {
}

// ------------------------------------------------------------------
// Version graph
// ------------------------------------------------------------------

std::vector<std::string> MergeEngine::VersionParents(db::Transaction& tx, const db::model::ObjectVersionRecord& version) {
  std::vector<std::string> parents;
  if (!version.supersedes_id.empty()) parents.push_back(version.supersedes_id);
  for (const auto& edge : provenance_->Parents(tx, version.id)) parents.push_back(edge.parent_version_id());
  return parents;
}

bool MergeEngine::IsVersionAncestor(db::Transaction& tx, const std::string& ancestor_id, const db::model::ObjectVersionRecord& descendant) {
  std::unordered_set<std::string> seen{descendant.id};
  std::deque<db::model::ObjectVersionRecord> queue{descendant};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();
    if (current.id == ancestor_id) return true;

    for (const auto& parent_id : VersionParents(tx, current)) {
      if (!seen.insert(parent_id).second) continue;
      if (auto parent = repository_->GetObjectVersion(tx, parent_id)) queue.push_back(std::move(*parent));
    }
  }
  return false;
}

/*
  Nearest common ancestor of two versions: the common ancestor with
  the highest version number. Versions are monotonic per canonical
  object, so that is the most recent shared state.
*/
std::optional<db::model::ObjectVersionRecord> MergeEngine::FindBaseVersion(db::Transaction& tx, const db::model::ObjectVersionRecord& a,
                                                                           const db::model::ObjectVersionRecord& b) {
  std::unordered_set<std::string> ancestors_of_a{a.id};
  {
    std::deque<db::model::ObjectVersionRecord> queue{a};
    while (!queue.empty()) {
      auto current = std::move(queue.front());
      queue.pop_front();
      for (const auto& parent_id : VersionParents(tx, current)) {
        if (!ancestors_of_a.insert(parent_id).second) continue;
        if (auto parent = repository_->GetObjectVersion(tx, parent_id)) queue.push_back(std::move(*parent));
      }
    }
  }

  std::optional<db::model::ObjectVersionRecord> best;
  std::unordered_set<std::string>               seen{b.id};
  std::deque<db::model::ObjectVersionRecord>    queue{b};
  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();

    if (ancestors_of_a.contains(current.id)) {
      if (!best || current.version > best->version) best = current;
      // older common ancestors behind this one cannot win
      continue;
    }

    for (const auto& parent_id : VersionParents(tx, current)) {
      if (!seen.insert(parent_id).second) continue;
      if (auto parent = repository_->GetObjectVersion(tx, parent_id)) queue.push_back(std::move(*parent));
    }
  }
  return best;
}

std::vector<std::string> MergeEngine::PathsSince(const db::model::ObjectVersionRecord& head, const db::model::ObjectVersionRecord& base) {
  if (head.id == base.id || head.content_hash == base.content_hash) return {};

  if (head.supersedes_id == base.id) {
    return diff::DiffEngine::ChangedPaths(store::ObjectStore::ChangeSummary(head));
  }
  return diff::DiffEngine::ChangedPaths(store_->Diff().Diff(store::ObjectStore::Properties(base), store::ObjectStore::Properties(head)));
}

// ------------------------------------------------------------------
// Classification
// ------------------------------------------------------------------

std::optional<MergeEngine::Classification> MergeEngine::Classify(db::Transaction& tx, const std::string& target_branch_id,
                                                                 const std::string& source_branch_id, const std::string& canonical_id) {
  auto source_head = lineage_->Resolve(tx, source_branch_id, canonical_id);
  if (!source_head) return std::nullopt;

  Classification c;
  c.source_head = source_head;
  c.target_head = lineage_->Resolve(tx, target_branch_id, canonical_id);

  auto& r = c.result;
  r.set_canonical_id(canonical_id);
  r.set_type(source_head->type);
  r.set_key(source_head->key);
  r.set_source_head_id(source_head->id);

  if (!c.target_head) {
    // deleted on the target after it already had the source's state
    auto decider = lineage_->ResolveRow(tx, target_branch_id, canonical_id);
    if (decider && IsVersionAncestor(tx, source_head->id, *decider)) {
      r.set_status(graphvc::v1::MERGE_STATUS_UNCHANGED);
      return c;
    }
    if (auto holder = store_->LiveKeyHolder(tx, target_branch_id, source_head->project_id, source_head->type, source_head->key, canonical_id)) {
      r.set_key_holder_id(holder->id);
      r.set_status(graphvc::v1::MERGE_STATUS_CONFLICT);
      return c;
    }
    r.set_status(graphvc::v1::MERGE_STATUS_ADDED);
    return c;
  }

  const auto& target_head = *c.target_head;
  r.set_target_head_id(target_head.id);

  if (target_head.id == source_head->id || target_head.content_hash == source_head->content_hash ||
      IsVersionAncestor(tx, source_head->id, target_head)) {
    r.set_status(graphvc::v1::MERGE_STATUS_UNCHANGED);
    return c;
  }

  c.base = FindBaseVersion(tx, target_head, *source_head);
  if (!c.base) {
    r.set_status(graphvc::v1::MERGE_STATUS_CONFLICT);
    return c;
  }
  r.set_base_version_id(c.base->id);

  const auto target_paths = PathsSince(target_head, *c.base);
  const auto source_paths = PathsSince(*source_head, *c.base);
  for (const auto& p : target_paths) r.add_target_paths(p);
  for (const auto& p : source_paths) r.add_source_paths(p);

  const auto overlap = diff::OverlappingPaths(target_paths, source_paths);
  if (!overlap.empty()) {
    for (const auto& p : overlap) r.add_conflicting_paths(p);
    r.set_status(graphvc::v1::MERGE_STATUS_CONFLICT);
    return c;
  }

  r.set_status(graphvc::v1::MERGE_STATUS_FAST_FORWARD);
  return c;
}

// ------------------------------------------------------------------
// Apply
// ------------------------------------------------------------------

std::string MergeEngine::Apply(db::Transaction& tx, const std::string& target_branch_id, Classification& c,
                               std::vector<db::model::ObjectVersionRecord>& written) {
  const auto& source_head = *c.source_head;

  store::ObjectStore::VersionDraft draft;
  draft.branch_id = target_branch_id;

  if (c.result.status() == graphvc::v1::MERGE_STATUS_ADDED) {
    draft.properties = store::ObjectStore::Properties(source_head);
    draft.labels     = store::ObjectStore::Labels(source_head);

    auto record = store_->AppendVersion(tx, source_head, source_head.id, google::protobuf::Struct{}, draft);
    provenance_->Record(tx, record.id, source_head.id, graphvc::v1::PROVENANCE_ROLE_SOURCE);
    written.push_back(record);
    return record.id;
  }

  const auto& target_head       = *c.target_head;
  const auto  target_properties = store::ObjectStore::Properties(target_head);

  draft.properties = target_properties;
  diff::DiffEngine::ApplyPaths(&draft.properties, store::ObjectStore::Properties(source_head),
                               {c.result.source_paths().begin(), c.result.source_paths().end()});
  draft.labels = UnionLabels(store::ObjectStore::Labels(target_head), store::ObjectStore::Labels(source_head));

  auto record = store_->AppendVersion(tx, target_head, target_head.id, target_properties, draft);
  provenance_->Record(tx, record.id, target_head.id, graphvc::v1::PROVENANCE_ROLE_TARGET);
  provenance_->Record(tx, record.id, source_head.id, graphvc::v1::PROVENANCE_ROLE_SOURCE);
  if (c.base && c.base->id != target_head.id && c.base->id != source_head.id) {
    provenance_->Record(tx, record.id, c.base->id, graphvc::v1::PROVENANCE_ROLE_BASE);
  }
  written.push_back(record);
  return record.id;
}

// ------------------------------------------------------------------
// Merge
// ------------------------------------------------------------------

graphvc::v1::MergeSummary MergeEngine::Merge(const graphvc::v1::MergeRequest& request) {
  const bool execute = request.mode() == graphvc::v1::MERGE_MODE_EXECUTE;

  observability::SpanScope span("graphvc.merge");
  span.SetAttribute("merge.target_branch_id", request.target_branch_id());
  span.SetAttribute("merge.source_branch_id", request.source_branch_id());
  span.SetAttribute("merge.execute", static_cast<int64_t>(execute));

  graphvc::v1::MergeSummary summary;
  summary.set_target_branch_id(request.target_branch_id());
  summary.set_source_branch_id(request.source_branch_id());
  summary.set_mode(execute ? graphvc::v1::MERGE_MODE_EXECUTE : graphvc::v1::MERGE_MODE_DRY_RUN);

  auto tx = repository_->Begin();

  auto target = repository_->GetBranch(*tx, request.target_branch_id());
  if (!target) throw util::NotFound("target branch not found: " + request.target_branch_id());
  auto source = repository_->GetBranch(*tx, request.source_branch_id());
  if (!source) throw util::NotFound("source branch not found: " + request.source_branch_id());
  if (target->organization_id != source->organization_id || target->project_id != source->project_id) {
    throw util::ValidationError("cannot merge branches of different projects");
  }

  if (auto base_branch = lineage_->NearestCommonAncestor(*tx, target->id, source->id)) {
    summary.set_base_branch_id(*base_branch);
  }

  // same branch: everything visible is trivially unchanged
  if (target->id == source->id) {
    std::vector<std::string> branch_ids;
    for (const auto& edge : lineage_->Ancestors(*tx, target->id)) branch_ids.push_back(edge.ancestor_branch_id);
    for (const auto& canonical_id : repository_->ListCanonicalIdsOnBranches(*tx, branch_ids)) {
      auto head = lineage_->Resolve(*tx, target->id, canonical_id);
      if (!head) continue;
      auto* r = summary.add_objects();
      r->set_canonical_id(canonical_id);
      r->set_type(head->type);
      r->set_key(head->key);
      r->set_status(graphvc::v1::MERGE_STATUS_UNCHANGED);
      r->set_target_head_id(head->id);
      r->set_source_head_id(head->id);
      Count(summary, r->status());
    }
    tx->Rollback();
    return summary;
  }

  std::set<std::string> branch_ids;
  for (const auto& edge : lineage_->Ancestors(*tx, target->id)) branch_ids.insert(edge.ancestor_branch_id);
  for (const auto& edge : lineage_->Ancestors(*tx, source->id)) branch_ids.insert(edge.ancestor_branch_id);

  std::vector<Classification> classifications;
  for (const auto& canonical_id : repository_->ListCanonicalIdsOnBranches(*tx, {branch_ids.begin(), branch_ids.end()})) {
    if (auto c = Classify(*tx, target->id, source->id, canonical_id)) classifications.push_back(std::move(*c));
  }

  std::vector<db::model::ObjectVersionRecord> written;
  if (execute) {
    // every canonical token before any (type, key) token, each group in
    // sorted order; Restore takes the same two kinds in the same order
    std::set<std::string> key_locks;
    for (const auto& c : classifications) {
      if (!Applicable(c.result.status())) continue;
      util::ThrowIfDbError(repository_->LockKey(*tx, store::ObjectStore::CanonicalLockKey(c.result.canonical_id())), "lock object");
      key_locks.insert(store::ObjectStore::KeyLockKey(c.source_head->project_id, c.result.type(), c.result.key()));
    }
    for (const auto& key : key_locks) util::ThrowIfDbError(repository_->LockKey(*tx, key), "lock object key");

    for (auto& c : classifications) {
      if (!Applicable(c.result.status())) continue;

      // re-verify under the key locks
      auto fresh = Classify(*tx, target->id, source->id, c.result.canonical_id());
      if (!fresh) {
        c.result.set_status(graphvc::v1::MERGE_STATUS_UNCHANGED);
        continue;
      }
      c = std::move(*fresh);
      if (!Applicable(c.result.status())) continue;

      c.result.set_merged_version_id(Apply(*tx, target->id, c, written));
    }
    tx->Commit();
    summary.set_applied(true);
    summary.set_applied_count(static_cast<uint32_t>(written.size()));
  } else {
    tx->Rollback();
  }

  for (auto& c : classifications) {
    Count(summary, c.result.status());
    *summary.add_objects() = std::move(c.result);
  }

  for (const auto& record : written) store_->Publish(record);

  span.SetAttribute("merge.conflicts", static_cast<int64_t>(summary.conflict_count()));
  GRAPHVC_LOG_INFO("merge completed", {StringField("target_branch_id", target->id), StringField("source_branch_id", source->id),
                                       StringField("base_branch_id", summary.base_branch_id()), StringField("mode", execute ? "execute" : "dry_run"),
                                       IntField("added", summary.added_count()), IntField("fast_forward", summary.fast_forward_count()),
                                       IntField("conflict", summary.conflict_count()), IntField("unchanged", summary.unchanged_count()),
                                       IntField("applied", summary.applied_count())});
  for (const auto& object : summary.objects()) {
    if (object.status() == graphvc::v1::MERGE_STATUS_CONFLICT) {
      GRAPHVC_LOG_DEBUG("merge conflict", {StringField("canonical_id", object.canonical_id()), StringField("status", StatusName(object.status())),
                                           PathsField("paths", {object.conflicting_paths().begin(), object.conflicting_paths().end()})});
    }
  }
  return summary;
}

} // namespace graphvc::merge
