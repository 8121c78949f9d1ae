#include "internal/service/graph_service.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using graphvc::v1::CreateBranchRequest;
using graphvc::v1::WriteObjectRequest;

std::shared_ptr<graphvc::service::GraphService> BuildService() {
  return graphvc::factory::Build(graphvc::config::ConfigLoader::Defaults()).service;
}

CreateBranchRequest BranchRequest(const std::string& name, const std::string& parent) {
  CreateBranchRequest req;
  req.set_organization_id("acme");
  req.set_project_id("graph");
  req.set_name(name);
  req.set_parent_branch_id(parent);
  return req;
}

WriteObjectRequest WriteRequest(const std::string& branch_id, const std::string& key, const std::string& title) {
  WriteObjectRequest req;
  req.set_organization_id("acme");
  req.set_project_id("graph");
  req.set_branch_id(branch_id);
  req.set_type("Document");
  req.set_key(key);
  (*req.mutable_properties()->mutable_fields())["title"].set_string_value(title);
  return req;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestBranchOperations() {
  auto service = BuildService();

  auto main   = service->CreateBranch(BranchRequest("main", ""));
  auto dev    = service->CreateBranch(BranchRequest("dev", main.id()));
  auto hotfix = service->CreateBranch(BranchRequest("hotfix", dev.id()));

  assert(main.parent_branch_id().empty());
  assert(hotfix.parent_branch_id() == dev.id());
  assert(service->GetBranch(dev.id()).name() == "dev");

  auto branches = service->ListBranches("acme", "graph");
  assert(branches.size() == 3);
  assert(std::any_of(branches.begin(), branches.end(), [&](const auto& b) { return b.id() == hotfix.id(); }));
  assert(service->ListBranches("acme", "other").empty());

  auto ancestors = service->Ancestors(hotfix.id());
  assert(ancestors.size() == 3);
  assert(ancestors[0].branch_id() == hotfix.id() && ancestors[0].depth() == 0);
  assert(ancestors[1].branch_id() == dev.id() && ancestors[1].depth() == 1);
  assert(ancestors[2].branch_id() == main.id() && ancestors[2].depth() == 2);

  assert(Throws<graphvc::util::NotFound>([&] { service->GetBranch("missing"); }));
  assert(Throws<graphvc::util::NotFound>([&] { service->Ancestors("missing"); }));
  assert(Throws<graphvc::util::NotFound>([&] { service->CreateBranch(BranchRequest("orphan", "missing")); }));
  assert(Throws<graphvc::util::Conflict>([&] { service->CreateBranch(BranchRequest("dev", main.id())); }));
}

void TestWritePatchMergeRoundTrip() {
  auto service = BuildService();
  auto main    = service->CreateBranch(BranchRequest("main", ""));
  auto dev     = service->CreateBranch(BranchRequest("dev", main.id()));

  auto v1 = service->Write(WriteRequest(main.id(), "readme", "Readme"));

  graphvc::v1::PatchObjectRequest patch;
  patch.set_object_id(v1.id());
  patch.set_branch_id(dev.id());
  (*patch.mutable_properties()->mutable_fields())["title"].set_string_value("README");
  auto v2 = service->Patch(patch);

  // dev sees its edit, main still sees the original
  assert(service->Resolve(dev.id(), v1.canonical_id())->id() == v2.id());
  assert(service->Resolve(main.id(), v1.canonical_id())->id() == v1.id());

  graphvc::v1::MergeRequest merge;
  merge.set_target_branch_id(main.id());
  merge.set_source_branch_id(dev.id());
  merge.set_mode(graphvc::v1::MERGE_MODE_EXECUTE);
  auto summary = service->Merge(merge);
  assert(summary.fast_forward_count() == 1);
  assert(summary.base_branch_id() == main.id());

  const auto& merged_id = summary.objects(0).merged_version_id();
  auto        head      = service->Resolve(main.id(), v1.canonical_id());
  assert(head->id() == merged_id);
  assert(head->properties().fields().at("title").string_value() == "README");

  auto parents = service->ProvenanceParents(merged_id);
  assert(parents.size() == 2);
  auto children = service->ProvenanceChildren(v2.id());
  assert(children.size() == 1 && children[0].child_version_id() == merged_id);

  graphvc::v1::HistoryRequest history;
  history.set_object_id(merged_id);
  auto versions = service->History(history);
  assert(versions.items_size() == 3);
  assert(versions.items(0).id() == merged_id);
}

void TestDeleteRestoreThroughService() {
  auto service = BuildService();
  auto main    = service->CreateBranch(BranchRequest("main", ""));
  auto v1      = service->Write(WriteRequest(main.id(), "notes", "Notes"));

  auto tomb = service->Delete(v1.id());
  assert(tomb.has_deleted_at());
  assert(!service->Resolve(main.id(), v1.canonical_id()).has_value());

  auto back = service->Restore(tomb.id());
  assert(!back.has_deleted_at());
  assert(service->Get(back.id()).properties().fields().at("title").string_value() == "Notes");
}

void TestErrorsKeepTheirKind() {
  auto service = BuildService();
  auto main    = service->CreateBranch(BranchRequest("main", ""));
  auto v1      = service->Write(WriteRequest(main.id(), "a", "A"));

  assert(Throws<graphvc::util::NotFound>([&] { service->Get("missing"); }));
  assert(Throws<graphvc::util::NotFound>([&] { service->Delete("missing"); }));
  assert(Throws<graphvc::util::Conflict>([&] { service->Restore(v1.id()); }));
  assert(Throws<graphvc::util::Conflict>([&] { service->Write(WriteRequest(main.id(), "a", "again")); }));
  assert(Throws<graphvc::util::ValidationError>([&] { service->Write(WriteRequest(main.id(), "", "no key")); }));
  assert(!service->Resolve("missing", v1.canonical_id()).has_value());
}

} // namespace

int main() {
  TestBranchOperations();
  TestWritePatchMergeRoundTrip();
  TestDeleteRestoreThroughService();
  TestErrorsKeepTheirKind();

  std::cout << "graphvc_unit_graph_service: pass\n";
  return 0;
}
