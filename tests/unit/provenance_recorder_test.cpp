#include "internal/provenance/provenance_recorder.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/store/object_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using graphvc::v1::ObjectVersion;
using graphvc::v1::ProvenanceRole;

struct Fixture {
  Fixture() : app(graphvc::factory::Build(graphvc::config::ConfigLoader::Defaults())) {
    graphvc::v1::CreateBranchRequest req;
    req.set_organization_id("org");
    req.set_project_id("proj");
    req.set_name("main");
    branch_id = app.lineage->CreateBranch(req).id();
  }

  ObjectVersion Write(const std::string& key) {
    graphvc::v1::WriteObjectRequest req;
    req.set_organization_id("org");
    req.set_project_id("proj");
    req.set_branch_id(branch_id);
    req.set_type("Doc");
    req.set_key(key);
    (*req.mutable_properties()->mutable_fields())["title"].set_string_value(key);
    return app.store->Write(req);
  }

  void Record(const std::string& child, const std::string& parent, ProvenanceRole role) {
    auto tx = app.repository->Begin();
    app.provenance->Record(*tx, child, parent, role);
    tx->Commit();
  }

  graphvc::factory::Application app;
  std::string                   branch_id;
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

void TestRoleNames() {
  using graphvc::provenance::ProvenanceRecorder;

  assert(ProvenanceRecorder::RoleName(graphvc::v1::PROVENANCE_ROLE_TARGET) == "target");
  assert(ProvenanceRecorder::RoleName(graphvc::v1::PROVENANCE_ROLE_SOURCE) == "source");
  assert(ProvenanceRecorder::RoleName(graphvc::v1::PROVENANCE_ROLE_BASE) == "base");
  assert(ProvenanceRecorder::ParseRole("base") == graphvc::v1::PROVENANCE_ROLE_BASE);
  assert(ProvenanceRecorder::ParseRole("BASE") == graphvc::v1::PROVENANCE_ROLE_UNSPECIFIED);
}

void TestParentsAndChildren() {
  Fixture f;
  auto    child  = f.Write("child");
  auto    target = f.Write("target");
  auto    source = f.Write("source");

  f.Record(child.id(), target.id(), graphvc::v1::PROVENANCE_ROLE_TARGET);
  f.Record(child.id(), source.id(), graphvc::v1::PROVENANCE_ROLE_SOURCE);

  auto parents = f.app.provenance->Parents(child.id());
  assert(parents.size() == 2);
  assert(parents[0].parent_version_id() == target.id());
  assert(parents[0].role() == graphvc::v1::PROVENANCE_ROLE_TARGET);
  assert(parents[1].parent_version_id() == source.id());
  assert(parents[0].has_created_at());

  auto children = f.app.provenance->Children(source.id());
  assert(children.size() == 1);
  assert(children[0].child_version_id() == child.id());
  assert(children[0].role() == graphvc::v1::PROVENANCE_ROLE_SOURCE);

  assert(f.app.provenance->Parents(source.id()).empty());
  assert(f.app.provenance->Children("unknown").empty());
}

void TestRejectsMalformedEdges() {
  Fixture f;
  auto    a = f.Write("a");
  auto    b = f.Write("b");

  assert(Throws<graphvc::util::ValidationError>([&] { f.Record("", b.id(), graphvc::v1::PROVENANCE_ROLE_SOURCE); }));
  assert(Throws<graphvc::util::ValidationError>([&] { f.Record(a.id(), a.id(), graphvc::v1::PROVENANCE_ROLE_SOURCE); }));
  assert(Throws<graphvc::util::ValidationError>([&] { f.Record(a.id(), b.id(), graphvc::v1::PROVENANCE_ROLE_UNSPECIFIED); }));

  f.Record(a.id(), b.id(), graphvc::v1::PROVENANCE_ROLE_SOURCE);
  assert(Throws<graphvc::util::Conflict>([&] { f.Record(a.id(), b.id(), graphvc::v1::PROVENANCE_ROLE_SOURCE); }));

  // same pair under another role is a distinct edge
  f.Record(a.id(), b.id(), graphvc::v1::PROVENANCE_ROLE_BASE);
  assert(f.app.provenance->Parents(a.id()).size() == 2);
}

void TestRolledBackEdgesVanish() {
  Fixture f;
  auto    a = f.Write("a");
  auto    b = f.Write("b");

  {
    auto tx = f.app.repository->Begin();
    f.app.provenance->Record(*tx, a.id(), b.id(), graphvc::v1::PROVENANCE_ROLE_TARGET);
    assert(f.app.provenance->Parents(*tx, a.id()).size() == 1);
    tx->Rollback();
  }
  assert(f.app.provenance->Parents(a.id()).empty());
}

} // namespace

int main() {
  TestRoleNames();
  TestParentsAndChildren();
  TestRejectsMalformedEdges();
  TestRolledBackEdgesVanish();

  std::cout << "graphvc_unit_provenance_recorder: pass\n";
  return 0;
}
