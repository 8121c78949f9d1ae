#include "internal/store/object_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/diff/canonical_json.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/validation/schema_validator.hpp"

namespace graphvc::store {

using graphvc::observability::IntField;
using graphvc::observability::PathsField;
using graphvc::observability::StringField;

namespace {

constexpr uint32_t kDefaultHistoryLimit = 50;
constexpr uint32_t kMaxHistoryLimit     = 1000;

void RequireField(const std::string& value, const char* name) {
  if (value.empty()) {
    throw util::ValidationError(std::string(name) + " must not be empty");
  }
}

// Existing labels first, new ones appended in request order.
std::vector<std::string> MergeLabels(std::vector<std::string> current, const google::protobuf::RepeatedPtrField<std::string>& added) {
  for (const auto& label : added) {
    if (std::find(current.begin(), current.end(), label) == current.end()) current.push_back(label);
  }
  return current;
}

std::vector<std::string> DedupLabels(const google::protobuf::RepeatedPtrField<std::string>& labels) {
  std::vector<std::string> out;
  return MergeLabels(std::move(out), labels);
}

} // namespace

ObjectStore::ObjectStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<lineage::LineageResolver> lineage, diff::DiffEngine diff,
                         std::shared_ptr<validation::SchemaValidator> validator, std::shared_ptr<events::EventSink> events)
    : repository_(std::move(repository)),
      lineage_(std::move(lineage)),
      diff_(std::move(diff)),
      validator_(std::move(validator)),
      events_(std::move(events)) {
}

std::string ObjectStore::CanonicalLockKey(const std::string& canonical_id) {
  return "obj|" + canonical_id;
}

std::string ObjectStore::KeyLockKey(const std::string& project_id, const std::string& type, const std::string& key) {
  return "obj|" + project_id + "|" + type + "|" + key;
}

// uniqueness is per visible head, not per row
std::optional<db::model::ObjectVersionRecord> ObjectStore::LiveKeyHolder(db::Transaction& tx, const std::string& branch_id, const std::string& project_id,
                                                                         const std::string& type, const std::string& key,
                                                                         const std::string& except_canonical_id) {
  for (const auto& canonical_id : repository_->FindCanonicalIds(tx, project_id, type, key)) {
    if (canonical_id == except_canonical_id) continue;
    if (auto head = lineage_->Resolve(tx, branch_id, canonical_id)) return head;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Record codec
// ------------------------------------------------------------------

google::protobuf::Struct ObjectStore::Properties(const db::model::ObjectVersionRecord& record) {
  google::protobuf::Struct properties;
  if (!record.properties.empty()) util::FromJson(record.properties, &properties);
  return properties;
}

std::vector<std::string> ObjectStore::Labels(const db::model::ObjectVersionRecord& record) {
  std::vector<std::string> labels;
  if (record.labels.empty()) return labels;

  google::protobuf::ListValue list;
  util::FromJson(record.labels, &list);
  for (const auto& value : list.values()) {
    if (!value.has_string_value()) {
      throw std::runtime_error("corrupt labels on version " + record.id);
    }
    labels.push_back(value.string_value());
  }
  return labels;
}

std::string ObjectStore::EncodeLabels(const std::vector<std::string>& labels) {
  google::protobuf::ListValue list;
  for (const auto& label : labels) list.add_values()->set_string_value(label);
  return util::ToJson(list);
}

graphvc::v1::ChangeSummary ObjectStore::ChangeSummary(const db::model::ObjectVersionRecord& record) {
  graphvc::v1::ChangeSummary summary;
  if (!record.change_summary.empty()) util::FromJson(record.change_summary, &summary);
  return summary;
}

graphvc::v1::ObjectVersion ObjectStore::ToProto(const db::model::ObjectVersionRecord& record) {
  graphvc::v1::ObjectVersion version;
  version.set_id(record.id);
  version.set_canonical_id(record.canonical_id);
  version.set_branch_id(record.branch_id);
  version.set_organization_id(record.organization_id);
  version.set_project_id(record.project_id);
  version.set_type(record.type);
  version.set_key(record.key);
  *version.mutable_properties() = Properties(record);
  for (auto& label : Labels(record)) version.add_labels(std::move(label));
  version.set_version(record.version);
  version.set_supersedes_id(record.supersedes_id);
  version.set_content_hash(record.content_hash);
  *version.mutable_change_summary() = ChangeSummary(record);
  *version.mutable_created_at()     = util::MillisToProto(record.created_at_ms);
  if (record.IsTombstone()) {
    *version.mutable_deleted_at() = util::MillisToProto(record.deleted_at_ms);
  }
  return version;
}

// ------------------------------------------------------------------
// Internals
// ------------------------------------------------------------------

db::model::ObjectVersionRecord ObjectStore::LoadVersion(db::Transaction& tx, const std::string& object_id) {
  auto record = repository_->GetObjectVersion(tx, object_id);
  if (!record) {
    throw util::NotFound("object version not found: " + object_id);
  }
  return *record;
}

db::model::ObjectVersionRecord ObjectStore::AppendVersion(db::Transaction& tx, const db::model::ObjectVersionRecord& identity,
                                                          const std::string& supersedes_id, const google::protobuf::Struct& previous_properties,
                                                          const VersionDraft& draft) {
  if (!draft.tombstone) {
    validator_->Validate(identity.type, draft.properties);
  }

  db::model::ObjectVersionRecord record;
  record.id              = util::NewId();
  record.canonical_id    = identity.canonical_id;
  record.branch_id       = draft.branch_id;
  record.organization_id = identity.organization_id;
  record.project_id      = identity.project_id;
  record.type            = identity.type;
  record.key             = identity.key;
  record.properties      = util::ToJson(draft.properties);
  record.labels          = EncodeLabels(draft.labels);
  record.version         = repository_->GetMaxVersion(tx, identity.canonical_id) + 1;
  record.supersedes_id   = supersedes_id;
  record.content_hash    = diff::ContentHash(draft.properties);
  record.change_summary  = util::ToJson(diff_.Diff(previous_properties, draft.properties));
  record.created_at_ms   = util::NowMillis();
  record.deleted_at_ms   = draft.tombstone ? record.created_at_ms : 0;

  util::ThrowIfDbError(repository_->InsertObjectVersion(tx, record), "insert object version");
  return record;
}

void ObjectStore::Publish(const db::model::ObjectVersionRecord& record) {
  if (!events_) return;

  graphvc::v1::ObjectChangedEvent event;
  event.set_object_id(record.id);
  event.set_canonical_id(record.canonical_id);
  event.set_branch_id(record.branch_id);
  event.set_type(record.type);
  const auto summary = ChangeSummary(record);
  for (const auto& path : summary.paths()) event.add_changed_paths(path);

  try {
    events_->Publish(event);
  } catch (const std::exception& e) {
    GRAPHVC_LOG_WARN("event sink failed", {StringField("object_id", record.id), StringField("error", e.what())});
  }
}

void ObjectStore::LogWrite(std::string_view op, const db::model::ObjectVersionRecord& record) {
  GRAPHVC_LOG_INFO("object version written", {StringField("op", op), StringField("object_id", record.id), StringField("canonical_id", record.canonical_id),
                                              StringField("branch_id", record.branch_id), IntField("version", static_cast<int64_t>(record.version))});
  GRAPHVC_LOG_DEBUG("object version paths", {StringField("object_id", record.id), PathsField("paths", diff::DiffEngine::ChangedPaths(ChangeSummary(record)))});
}

// ------------------------------------------------------------------
// Mutations
// ------------------------------------------------------------------

graphvc::v1::ObjectVersion ObjectStore::Write(const graphvc::v1::WriteObjectRequest& request) {
  RequireField(request.organization_id(), "organization_id");
  RequireField(request.project_id(), "project_id");
  RequireField(request.branch_id(), "branch_id");
  RequireField(request.type(), "type");
  RequireField(request.key(), "key");

  auto tx = repository_->Begin();

  auto branch = repository_->GetBranch(*tx, request.branch_id());
  if (!branch) {
    throw util::NotFound("branch not found: " + request.branch_id());
  }
  if (branch->organization_id != request.organization_id() || branch->project_id != request.project_id()) {
    throw util::ValidationError("branch " + request.branch_id() + " belongs to another project");
  }

  util::ThrowIfDbError(repository_->LockKey(*tx, KeyLockKey(request.project_id(), request.type(), request.key())), "lock object key");
  if (LiveKeyHolder(*tx, request.branch_id(), request.project_id(), request.type(), request.key())) {
    throw util::Conflict("object already exists on branch: " + request.type() + "/" + request.key());
  }

  db::model::ObjectVersionRecord identity;
  identity.canonical_id    = util::NewId();
  identity.organization_id = request.organization_id();
  identity.project_id      = request.project_id();
  identity.type            = request.type();
  identity.key             = request.key();

  VersionDraft draft;
  draft.branch_id  = request.branch_id();
  draft.properties = request.properties();
  draft.labels     = DedupLabels(request.labels());

  auto record = AppendVersion(*tx, identity, "", google::protobuf::Struct{}, draft);
  tx->Commit();

  LogWrite("write", record);
  Publish(record);
  return ToProto(record);
}

graphvc::v1::ObjectVersion ObjectStore::Patch(const graphvc::v1::PatchObjectRequest& request) {
  RequireField(request.object_id(), "object_id");

  auto tx      = repository_->Begin();
  auto version = LoadVersion(*tx, request.object_id());

  util::ThrowIfDbError(repository_->LockKey(*tx, CanonicalLockKey(version.canonical_id)), "lock object");

  const auto write_branch_id = request.branch_id().empty() ? version.branch_id : request.branch_id();
  auto       write_branch    = repository_->GetBranch(*tx, write_branch_id);
  if (!write_branch) {
    throw util::NotFound("branch not found: " + write_branch_id);
  }
  if (write_branch->project_id != version.project_id || write_branch->organization_id != version.organization_id) {
    throw util::ValidationError("branch " + write_branch_id + " belongs to another project");
  }

  // re-verified under the lock
  auto head = lineage_->Resolve(*tx, write_branch_id, version.canonical_id);
  if (!head) {
    throw util::Conflict("object is deleted on branch " + write_branch_id + ": " + version.canonical_id);
  }
  if (head->id != version.id) {
    throw util::Conflict("stale object version " + version.id + ": head is " + head->id);
  }

  const auto previous = Properties(*head);

  VersionDraft draft;
  draft.branch_id  = write_branch_id;
  draft.properties = previous;
  for (const auto& [name, value] : request.properties().fields()) {
    (*draft.properties.mutable_fields())[name] = value;
  }

  const auto current_labels = Labels(*head);
  draft.labels              = request.replace_labels() ? DedupLabels(request.labels()) : MergeLabels(current_labels, request.labels());

  if (diff::ContentHash(draft.properties) == head->content_hash && draft.labels == current_labels) {
    tx->Commit();
    GRAPHVC_LOG_DEBUG("patch had no effective change", {StringField("object_id", head->id)});
    return ToProto(*head);
  }

  auto record = AppendVersion(*tx, *head, head->id, previous, draft);
  tx->Commit();

  LogWrite("patch", record);
  Publish(record);
  return ToProto(record);
}

graphvc::v1::ObjectVersion ObjectStore::SoftDelete(const std::string& object_id) {
  RequireField(object_id, "object_id");

  auto tx      = repository_->Begin();
  auto version = LoadVersion(*tx, object_id);

  util::ThrowIfDbError(repository_->LockKey(*tx, CanonicalLockKey(version.canonical_id)), "lock object");

  auto head = lineage_->Resolve(*tx, version.branch_id, version.canonical_id);
  if (!head) {
    throw util::Conflict("object already deleted: " + version.canonical_id);
  }
  if (head->id != version.id) {
    throw util::Conflict("stale object version " + version.id + ": head is " + head->id);
  }

  VersionDraft draft;
  draft.branch_id = version.branch_id;
  draft.tombstone = true;

  auto record = AppendVersion(*tx, *head, head->id, Properties(*head), draft);
  tx->Commit();

  LogWrite("delete", record);
  Publish(record);
  return ToProto(record);
}

graphvc::v1::ObjectVersion ObjectStore::Restore(const std::string& object_id) {
  RequireField(object_id, "object_id");

  auto tx      = repository_->Begin();
  auto version = LoadVersion(*tx, object_id);

  util::ThrowIfDbError(repository_->LockKey(*tx, CanonicalLockKey(version.canonical_id)), "lock object");

  auto latest = repository_->GetLatestOnBranch(*tx, version.canonical_id, version.branch_id);
  if (!latest || !latest->IsTombstone()) {
    throw util::Conflict("object is not deleted on branch " + version.branch_id + ": " + version.canonical_id);
  }

  // walk back to the last live content
  std::optional<db::model::ObjectVersionRecord> live;
  for (auto cursor = latest->supersedes_id; !cursor.empty();) {
    auto previous = repository_->GetObjectVersion(*tx, cursor);
    if (!previous) break;
    if (!previous->IsTombstone()) {
      live = std::move(previous);
      break;
    }
    cursor = previous->supersedes_id;
  }
  if (!live) {
    throw util::Conflict("no live version to restore for " + version.canonical_id);
  }

  util::ThrowIfDbError(repository_->LockKey(*tx, KeyLockKey(version.project_id, version.type, version.key)), "lock object key");
  if (LiveKeyHolder(*tx, version.branch_id, version.project_id, version.type, version.key, version.canonical_id)) {
    throw util::Conflict("key is held by another object on branch: " + version.type + "/" + version.key);
  }

  VersionDraft draft;
  draft.branch_id  = version.branch_id;
  draft.properties = Properties(*live);
  draft.labels     = Labels(*live);

  auto record = AppendVersion(*tx, *latest, latest->id, Properties(*latest), draft);
  tx->Commit();

  LogWrite("restore", record);
  Publish(record);
  return ToProto(record);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

graphvc::v1::ObjectVersion ObjectStore::Get(const std::string& object_id) {
  auto tx     = repository_->Begin();
  auto record = LoadVersion(*tx, object_id);
  tx->Commit();
  return ToProto(record);
}

graphvc::v1::HistoryResponse ObjectStore::History(const graphvc::v1::HistoryRequest& request) {
  RequireField(request.object_id(), "object_id");

  const uint32_t limit = request.limit() == 0 ? kDefaultHistoryLimit : std::min(request.limit(), kMaxHistoryLimit);

  auto tx       = repository_->Begin();
  auto version  = LoadVersion(*tx, request.object_id());
  auto versions = repository_->ListVersions(*tx, version.canonical_id, request.before_version(), limit);
  tx->Commit();

  graphvc::v1::HistoryResponse response;
  for (const auto& record : versions) *response.add_items() = ToProto(record);

  if (versions.size() == limit && versions.back().version > 1) {
    response.set_next_before_version(versions.back().version);
  }
  return response;
}

std::optional<graphvc::v1::ObjectVersion> ObjectStore::Resolve(const std::string& branch_id, const std::string& canonical_id) {
  auto head = lineage_->Resolve(branch_id, canonical_id);
  if (!head) return std::nullopt;
  return ToProto(*head);
}

} // namespace graphvc::store
