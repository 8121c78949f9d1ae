#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "graphvc/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/diff/diff_engine.hpp"

namespace graphvc::events {
class EventSink;
}
namespace graphvc::lineage {
class LineageResolver;
}
namespace graphvc::validation {
class SchemaValidator;
}

namespace graphvc::store {

/*
  Append-only versioned object store.

  Every mutation inserts a new immutable row at version N+1, where N is
  the highest version of the canonical object on any branch. Writers
  take a key lock for the whole transaction:

    create                    obj|<project>|<type>|<key>
    patch / delete / restore  obj|<canonical_id>

  and re-check the visible head after the lock is held. Restore also
  takes the create key, after the canonical one.
*/
class ObjectStore {
 public:
  // Contents of a version about to be appended.
  struct VersionDraft {
    std::string              branch_id;
    google::protobuf::Struct properties;
    std::vector<std::string> labels;
    bool                     tombstone = false;
  };

  ObjectStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<lineage::LineageResolver> lineage, diff::DiffEngine diff,
              std::shared_ptr<validation::SchemaValidator> validator, std::shared_ptr<events::EventSink> events);

  graphvc::v1::ObjectVersion Write(const graphvc::v1::WriteObjectRequest& request);
  graphvc::v1::ObjectVersion Patch(const graphvc::v1::PatchObjectRequest& request);
  graphvc::v1::ObjectVersion SoftDelete(const std::string& object_id);
  graphvc::v1::ObjectVersion Restore(const std::string& object_id);

  graphvc::v1::ObjectVersion                Get(const std::string& object_id);
  graphvc::v1::HistoryResponse              History(const graphvc::v1::HistoryRequest& request);
  std::optional<graphvc::v1::ObjectVersion> Resolve(const std::string& branch_id, const std::string& canonical_id);

  // ------------------------------------------------------------------
  // building blocks for callers that own the transaction and key locks
  // ------------------------------------------------------------------

  // `identity` supplies canonical id, org, project, type and key. The change
  // summary is computed against `previous_properties`.
  db::model::ObjectVersionRecord AppendVersion(db::Transaction& tx, const db::model::ObjectVersionRecord& identity, const std::string& supersedes_id,
                                               const google::protobuf::Struct& previous_properties, const VersionDraft& draft);

  // Live head on `branch_id` of an object other than `except_canonical_id`
  // holding (type, key). Callers hold KeyLockKey for the pair.
  std::optional<db::model::ObjectVersionRecord> LiveKeyHolder(db::Transaction& tx, const std::string& branch_id, const std::string& project_id,
                                                              const std::string& type, const std::string& key,
                                                              const std::string& except_canonical_id = "");

  // Best effort ObjectChangedEvent; call after commit.
  void Publish(const db::model::ObjectVersionRecord& record);

  const diff::DiffEngine& Diff() const {
    return diff_;
  }

  static std::string CanonicalLockKey(const std::string& canonical_id);
  static std::string KeyLockKey(const std::string& project_id, const std::string& type, const std::string& key);

  static graphvc::v1::ObjectVersion    ToProto(const db::model::ObjectVersionRecord& record);
  static google::protobuf::Struct      Properties(const db::model::ObjectVersionRecord& record);
  static std::vector<std::string>      Labels(const db::model::ObjectVersionRecord& record);
  static graphvc::v1::ChangeSummary    ChangeSummary(const db::model::ObjectVersionRecord& record);
  static std::string                   EncodeLabels(const std::vector<std::string>& labels);

 private:
  db::model::ObjectVersionRecord LoadVersion(db::Transaction& tx, const std::string& object_id);
  void                           LogWrite(std::string_view op, const db::model::ObjectVersionRecord& record);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<lineage::LineageResolver>    lineage_;
  diff::DiffEngine                             diff_;
  std::shared_ptr<validation::SchemaValidator> validator_;
  std::shared_ptr<events::EventSink>           events_;
};

} // namespace graphvc::store
