#include "internal/merge/merge_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/provenance/provenance_recorder.hpp"
#include "internal/store/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/validation/schema_validator.hpp"

namespace {

using graphvc::v1::Branch;
using graphvc::v1::MergeMode;
using graphvc::v1::MergeSummary;
using graphvc::v1::ObjectMergeResult;
using graphvc::v1::ObjectVersion;

struct Fixture {
  Fixture() : app(graphvc::factory::Build(graphvc::config::ConfigLoader::Defaults())) {
    main    = CreateBranch("main", "");
    feature = CreateBranch("feature", main.id());
  }

  Branch CreateBranch(const std::string& name, const std::string& parent, const std::string& project = "proj") {
    graphvc::v1::CreateBranchRequest req;
    req.set_organization_id("org");
    req.set_project_id(project);
    req.set_name(name);
    req.set_parent_branch_id(parent);
    return app.lineage->CreateBranch(req);
  }

  ObjectVersion Write(const std::string& branch_id, const std::string& key, const std::string& properties_json,
                      std::vector<std::string> labels = {}) {
    graphvc::v1::WriteObjectRequest req;
    req.set_organization_id("org");
    req.set_project_id("proj");
    req.set_branch_id(branch_id);
    req.set_type("Person");
    req.set_key(key);
    graphvc::util::FromJson(properties_json, req.mutable_properties());
    for (auto& l : labels) req.add_labels(l);
    return app.store->Write(req);
  }

  ObjectVersion Patch(const ObjectVersion& head, const std::string& properties_json, const std::string& branch_id = "") {
    graphvc::v1::PatchObjectRequest req;
    req.set_object_id(head.id());
    req.set_branch_id(branch_id);
    graphvc::util::FromJson(properties_json, req.mutable_properties());
    return app.store->Patch(req);
  }

  MergeSummary Merge(const std::string& target, const std::string& source, MergeMode mode) {
    graphvc::v1::MergeRequest req;
    req.set_target_branch_id(target);
    req.set_source_branch_id(source);
    req.set_mode(mode);
    return app.merge->Merge(req);
  }

  MergeSummary DryRun() {
    return Merge(main.id(), feature.id(), graphvc::v1::MERGE_MODE_DRY_RUN);
  }

  MergeSummary Execute() {
    return Merge(main.id(), feature.id(), graphvc::v1::MERGE_MODE_EXECUTE);
  }

  const ObjectMergeResult* Find(const MergeSummary& summary, const std::string& canonical_id) {
    for (const auto& object : summary.objects()) {
      if (object.canonical_id() == canonical_id) return &object;
    }
    return nullptr;
  }

  std::string PropertyOn(const std::string& branch_id, const std::string& canonical_id, const std::string& name) {
    auto head = app.store->Resolve(branch_id, canonical_id);
    assert(head.has_value());
    return head->properties().fields().at(name).string_value();
  }

  graphvc::factory::Application app;
  Branch                        main;
  Branch                        feature;
};

// Accepts the first `allowed` versions it sees, rejects the rest.
class CountingValidator final : public graphvc::validation::SchemaValidator {
 public:
  void Validate(const std::string& type, const google::protobuf::Struct&) const override {
    if (seen++ >= allowed) throw graphvc::util::ValidationError("rejected " + type);
  }

  int         allowed = 0;
  mutable int seen    = 0;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestAddedObjectIsCopiedToTarget() {
  Fixture f;
  auto    bob = f.Write(f.feature.id(), "bob", R"({"name":"Bob"})", {"new"});

  auto dry = f.DryRun();
  assert(dry.mode() == graphvc::v1::MERGE_MODE_DRY_RUN);
  assert(!dry.applied());
  assert(dry.added_count() == 1 && dry.objects_size() == 1);
  assert(dry.objects(0).status() == graphvc::v1::MERGE_STATUS_ADDED);
  assert(dry.objects(0).source_head_id() == bob.id());
  assert(dry.objects(0).merged_version_id().empty());
  assert(dry.base_branch_id() == f.main.id());
  assert(!f.app.store->Resolve(f.main.id(), bob.canonical_id()).has_value());

  auto summary = f.Execute();
  assert(summary.applied() && summary.applied_count() == 1);
  const auto& merged_id = summary.objects(0).merged_version_id();
  assert(!merged_id.empty());

  auto merged = f.app.store->Get(merged_id);
  assert(merged.branch_id() == f.main.id());
  assert(merged.canonical_id() == bob.canonical_id());
  assert(merged.version() == 2);
  assert(merged.supersedes_id() == bob.id());
  assert(merged.content_hash() == bob.content_hash());
  assert(merged.labels_size() == 1 && merged.labels(0) == "new");

  auto parents = f.app.provenance->Parents(merged_id);
  assert(parents.size() == 1);
  assert(parents[0].parent_version_id() == bob.id());
  assert(parents[0].role() == graphvc::v1::PROVENANCE_ROLE_SOURCE);

  // the source branch keeps its own head
  assert(f.app.store->Resolve(f.feature.id(), bob.canonical_id())->id() == bob.id());

  auto again = f.DryRun();
  assert(again.unchanged_count() == 1 && again.added_count() == 0);
}

void TestDisjointEditsFastForward() {
  Fixture f;
  auto    v1 = f.Write(f.main.id(), "ada", R"({"name":"Ada","city":"Paris"})", {"a"});
  auto    v2 = f.Patch(v1, R"({"name":"Ada L"})", f.feature.id());
  auto    v3 = f.Patch(v1, R"({"city":"Lyon"})");

  auto dry = f.DryRun();
  auto r   = f.Find(dry, v1.canonical_id());
  assert(r != nullptr);
  assert(r->status() == graphvc::v1::MERGE_STATUS_FAST_FORWARD);
  assert(r->base_version_id() == v1.id());
  assert(r->target_head_id() == v3.id() && r->source_head_id() == v2.id());
  assert(r->target_paths_size() == 1 && r->target_paths(0) == "/city");
  assert(r->source_paths_size() == 1 && r->source_paths(0) == "/name");
  assert(r->conflicting_paths_size() == 0);

  // dry run wrote nothing
  assert(f.app.store->Resolve(f.main.id(), v1.canonical_id())->id() == v3.id());
  graphvc::v1::HistoryRequest history;
  history.set_object_id(v1.id());
  assert(f.app.store->History(history).items_size() == 3);

  auto summary = f.Execute();
  assert(summary.fast_forward_count() == 1 && summary.applied_count() == 1);

  auto merged = f.app.store->Get(f.Find(summary, v1.canonical_id())->merged_version_id());
  assert(merged.version() == 4);
  assert(merged.supersedes_id() == v3.id());
  assert(merged.properties().fields().at("name").string_value() == "Ada L");
  assert(merged.properties().fields().at("city").string_value() == "Lyon");

  auto parents = f.app.provenance->Parents(merged.id());
  assert(parents.size() == 3);
  assert(parents[0].role() == graphvc::v1::PROVENANCE_ROLE_TARGET && parents[0].parent_version_id() == v3.id());
  assert(parents[1].role() == graphvc::v1::PROVENANCE_ROLE_SOURCE && parents[1].parent_version_id() == v2.id());
  assert(parents[2].role() == graphvc::v1::PROVENANCE_ROLE_BASE && parents[2].parent_version_id() == v1.id());

  // the source head is now in the target's history
  auto again = f.DryRun();
  assert(f.Find(again, v1.canonical_id())->status() == graphvc::v1::MERGE_STATUS_UNCHANGED);
}

void TestSourceOnlyChangeFastForwardsWithoutBaseEdge() {
  Fixture f;
  auto    v1 = f.Write(f.main.id(), "ada", R"({"name":"Ada"})");
  auto    v2 = f.Patch(v1, R"({"email":"ada@example.org"})", f.feature.id());

  auto summary = f.Execute();
  auto r       = f.Find(summary, v1.canonical_id());
  assert(r->status() == graphvc::v1::MERGE_STATUS_FAST_FORWARD);
  assert(r->target_paths_size() == 0);

  auto merged = f.app.store->Get(r->merged_version_id());
  assert(merged.content_hash() == v2.content_hash());

  auto parents = f.app.provenance->Parents(merged.id());
  assert(parents.size() == 2);
  assert(f.app.provenance->Children(v2.id()).size() == 1);
}

void TestOverlappingEditsConflict() {
  Fixture f;
  auto    v1 = f.Write(f.main.id(), "ada", R"({"name":"Ada","address":{"city":"Paris"}})");
  f.Patch(v1, R"({"address":{"city":"Nice"}})", f.feature.id());
  auto v3 = f.Patch(v1, R"({"address":{"city":"Lyon","zip":"69001"}})");

  auto summary = f.Execute();
  assert(summary.conflict_count() == 1);
  assert(summary.applied() && summary.applied_count() == 0);

  auto r = f.Find(summary, v1.canonical_id());
  assert(r->status() == graphvc::v1::MERGE_STATUS_CONFLICT);
  assert(r->merged_version_id().empty());
  assert(r->conflicting_paths_size() == 1 && r->conflicting_paths(0) == "/address/city");

  // conflicts are never applied
  assert(f.app.store->Resolve(f.main.id(), v1.canonical_id())->id() == v3.id());
}

void TestOnlyTargetMovedIsUnchanged() {
  Fixture f;
  auto    v1 = f.Write(f.main.id(), "ada", R"({"name":"Ada"})");
  f.Patch(v1, R"({"name":"Ada B"})");

  auto summary = f.Execute();
  assert(summary.unchanged_count() == 1);
  assert(summary.applied_count() == 0);
}

void TestTargetDeleteAfterMergeStaysDeleted() {
  Fixture f;
  auto    bob     = f.Write(f.feature.id(), "bob", R"({"name":"Bob"})");
  auto    summary = f.Execute();
  f.app.store->SoftDelete(summary.objects(0).merged_version_id());

  auto again = f.DryRun();
  assert(f.Find(again, bob.canonical_id())->status() == graphvc::v1::MERGE_STATUS_UNCHANGED);

  f.Execute();
  assert(!f.app.store->Resolve(f.main.id(), bob.canonical_id()).has_value());
}

void TestSourceDeleteIsSkipped() {
  Fixture f;
  auto    v1 = f.Write(f.main.id(), "carl", R"({"name":"Carl"})");
  auto    v2 = f.Patch(v1, R"({"name":"Carl D"})", f.feature.id());
  f.app.store->SoftDelete(v2.id());

  auto summary = f.DryRun();
  assert(f.Find(summary, v1.canonical_id()) == nullptr);
  assert(f.app.store->Resolve(f.main.id(), v1.canonical_id())->id() == v1.id());
}

void TestSameBranchIsUnchanged() {
  Fixture f;
  f.Write(f.main.id(), "ada", R"({"name":"Ada"})");
  f.Write(f.main.id(), "bob", R"({"name":"Bob"})");

  auto summary = f.Merge(f.main.id(), f.main.id(), graphvc::v1::MERGE_MODE_EXECUTE);
  assert(summary.unchanged_count() == 2);
  assert(summary.objects_size() == 2);
  assert(!summary.applied());
}

void TestRejectsUnknownOrForeignBranches() {
  Fixture f;
  auto    other = f.CreateBranch("main", "", "other-project");

  assert(Throws<graphvc::util::NotFound>([&] { f.Merge("missing", f.feature.id(), graphvc::v1::MERGE_MODE_DRY_RUN); }));
  assert(Throws<graphvc::util::NotFound>([&] { f.Merge(f.main.id(), "missing", graphvc::v1::MERGE_MODE_DRY_RUN); }));
  assert(Throws<graphvc::util::ValidationError>([&] { f.Merge(f.main.id(), other.id(), graphvc::v1::MERGE_MODE_DRY_RUN); }));
}

void TestSameKeyOnBothSidesConflicts() {
  Fixture f;
  auto    on_feature = f.Write(f.feature.id(), "k1", R"({"name":"Feature"})");
  auto    on_main    = f.Write(f.main.id(), "k1", R"({"name":"Main"})");

  auto dry = f.DryRun();
  assert(dry.added_count() == 0 && dry.conflict_count() == 1);
  auto r = f.Find(dry, on_feature.canonical_id());
  assert(r->status() == graphvc::v1::MERGE_STATUS_CONFLICT);
  assert(r->key_holder_id() == on_main.id());

  auto summary = f.Execute();
  assert(summary.applied() && summary.applied_count() == 0);
  assert(!f.app.store->Resolve(f.main.id(), on_feature.canonical_id()).has_value());
  assert(f.app.store->Resolve(f.main.id(), on_main.canonical_id())->id() == on_main.id());

  // once the holder is deleted the key is free and the object merges in
  f.app.store->SoftDelete(on_main.id());
  auto retry = f.Execute();
  assert(retry.added_count() == 1 && retry.applied_count() == 1);
  assert(f.app.store->Resolve(f.main.id(), on_feature.canonical_id()).has_value());
}

void TestFailedExecuteRollsBackEveryWrite() {
  Fixture f;
  auto    base   = f.Write(f.main.id(), "ada", R"({"name":"Ada","age":36})");
  auto    ff     = f.Patch(base, R"({"age":37})", f.feature.id());
  auto    first  = f.Write(f.feature.id(), "bob", R"({"name":"Bob"})");
  auto    second = f.Write(f.feature.id(), "cid", R"({"name":"Cid"})");

  // same storage, a store whose validator fails after the first merged version
  auto validator     = std::make_shared<CountingValidator>();
  validator->allowed = 1;
  auto store         = std::make_shared<graphvc::store::ObjectStore>(f.app.repository, f.app.lineage, graphvc::diff::DiffEngine(), validator, nullptr);
  graphvc::merge::MergeEngine engine(f.app.repository, f.app.lineage, store, f.app.provenance);

  graphvc::v1::MergeRequest req;
  req.set_target_branch_id(f.main.id());
  req.set_source_branch_id(f.feature.id());
  req.set_mode(graphvc::v1::MERGE_MODE_EXECUTE);
  assert(Throws<graphvc::util::ValidationError>([&] { engine.Merge(req); }));
  assert(validator->seen == 2);

  assert(f.app.store->Resolve(f.main.id(), base.canonical_id())->id() == base.id());
  assert(!f.app.store->Resolve(f.main.id(), first.canonical_id()).has_value());
  assert(!f.app.store->Resolve(f.main.id(), second.canonical_id()).has_value());
  for (const auto& head : {ff, first, second}) assert(f.app.provenance->Children(head.id()).empty());
  assert(f.app.provenance->Children(base.id()).empty());

  // nothing half-applied: the regular engine still sees all three
  auto dry = f.DryRun();
  assert(dry.added_count() == 2 && dry.fast_forward_count() == 1);
}

} // namespace

int main() {
  TestAddedObjectIsCopiedToTarget();
  TestDisjointEditsFastForward();
  TestSourceOnlyChangeFastForwardsWithoutBaseEdge();
  TestOverlappingEditsConflict();
  TestOnlyTargetMovedIsUnchanged();
  TestTargetDeleteAfterMergeStaysDeleted();
  TestSourceDeleteIsSkipped();
  TestSameBranchIsUnchanged();
  TestRejectsUnknownOrForeignBranches();
  TestSameKeyOnBothSidesConflicts();
  TestFailedExecuteRollsBackEveryWrite();

  std::cout << "graphvc_unit_merge_engine: pass\n";
  return 0;
}
