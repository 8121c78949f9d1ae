#include "internal/lineage/lineage_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using graphvc::db::memory::MemoryRepository;
using graphvc::lineage::LineageResolver;
using graphvc::v1::Branch;
using graphvc::v1::CreateBranchRequest;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo     = std::make_shared<MemoryRepository>();
  std::shared_ptr<LineageResolver>  resolver = std::make_shared<LineageResolver>(repo);

  Branch Create(const std::string& name, const std::string& parent = "", const std::string& project = "proj") {
    CreateBranchRequest req;
    req.set_organization_id("org");
    req.set_project_id(project);
    req.set_name(name);
    req.set_parent_branch_id(parent);
    return resolver->CreateBranch(req);
  }

  void InsertVersion(const std::string& id, const std::string& canonical_id, uint64_t version, const std::string& branch_id, bool tombstone = false) {
    graphvc::db::model::ObjectVersionRecord v;
    v.id              = id;
    v.canonical_id    = canonical_id;
    v.branch_id       = branch_id;
    v.organization_id = "org";
    v.project_id      = "proj";
    v.type            = "Person";
    v.key             = "k";
    v.properties      = "{}";
    v.labels          = "[]";
    v.version         = version;
    v.change_summary  = "{}";
    v.deleted_at_ms   = tombstone ? 1 : 0;

    auto tx = repo->Begin();
    assert(repo->InsertObjectVersion(*tx, v));
    tx->Commit();
  }
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

void TestAncestorsAreNearestFirst() {
  Fixture f;
  auto    main    = f.Create("main");
  auto    feature = f.Create("feature", main.id());
  auto    fix     = f.Create("fix", feature.id());

  auto ancestors = f.resolver->Ancestors(fix.id());
  assert(ancestors.size() == 3);
  assert(ancestors[0].branch_id() == fix.id() && ancestors[0].depth() == 0);
  assert(ancestors[1].branch_id() == feature.id() && ancestors[1].depth() == 1);
  assert(ancestors[2].branch_id() == main.id() && ancestors[2].depth() == 2);

  assert(fix.parent_branch_id() == feature.id());
  assert(f.resolver->GetBranch(fix.id())->name() == "fix");
}

void TestCreateBranchErrors() {
  Fixture f;
  auto    main = f.Create("main");

  assert(Throws<graphvc::util::Conflict>([&] { f.Create("main"); }));
  assert(Throws<graphvc::util::NotFound>([&] { f.Create("orphan", "no-such-branch"); }));
  assert(Throws<graphvc::util::ValidationError>([&] { f.Create(""); }));
  assert(Throws<graphvc::util::ValidationError>([&] { f.Create("cross", main.id(), "other-project"); }));
  assert(Throws<graphvc::util::NotFound>([&] { f.resolver->Ancestors("no-such-branch"); }));

  // same name in another project is fine
  f.Create("main", "", "other-project");
}

void TestListBranchesIsScopedToProject() {
  Fixture f;
  auto    main = f.Create("main");
  f.Create("dev", main.id());
  f.Create("main", "", "elsewhere");

  auto branches = f.resolver->ListBranches("org", "proj");
  assert(branches.size() == 2);
  for (const auto& b : branches) assert(b.project_id() == "proj");
}

void TestNearestCommonAncestor() {
  Fixture f;
  auto    main = f.Create("main");
  auto    a    = f.Create("a", main.id());
  auto    b    = f.Create("b", main.id());
  auto    a1   = f.Create("a1", a.id());
  auto    a2   = f.Create("a2", a.id());

  assert(*f.resolver->NearestCommonAncestor(a1.id(), a2.id()) == a.id());
  assert(*f.resolver->NearestCommonAncestor(a1.id(), b.id()) == main.id());
  assert(*f.resolver->NearestCommonAncestor(a1.id(), a.id()) == a.id());
  assert(*f.resolver->NearestCommonAncestor(b.id(), b.id()) == b.id());

  auto unrelated = f.Create("root2");
  assert(!f.resolver->NearestCommonAncestor(unrelated.id(), a.id()).has_value());
}

void TestResolveWalksLineage() {
  Fixture f;
  auto    main    = f.Create("main");
  auto    feature = f.Create("feature", main.id());
  auto    fix     = f.Create("fix", feature.id());

  f.InsertVersion("v1", "c1", 1, main.id());
  assert(f.resolver->Resolve(fix.id(), "c1")->id == "v1");

  f.InsertVersion("v2", "c1", 2, feature.id());
  assert(f.resolver->Resolve(fix.id(), "c1")->id == "v2");
  assert(f.resolver->Resolve(main.id(), "c1")->id == "v1");

  // a tombstone on the nearest branch hides older ancestors
  f.InsertVersion("v3", "c1", 3, feature.id(), true);
  assert(!f.resolver->Resolve(fix.id(), "c1").has_value());
  assert(f.resolver->Resolve(main.id(), "c1")->id == "v1");

  auto tx  = f.repo->Begin();
  auto row = f.resolver->ResolveRow(*tx, fix.id(), "c1");
  assert(row && row->id == "v3" && row->IsTombstone());

  assert(!f.resolver->Resolve(fix.id(), "unknown").has_value());
  assert(!f.resolver->Resolve("unknown-branch", "c1").has_value());
}

} // namespace

int main() {
  TestAncestorsAreNearestFirst();
  TestCreateBranchErrors();
  TestListBranchesIsScopedToProject();
  TestNearestCommonAncestor();
  TestResolveWalksLineage();

  std::cout << "graphvc_unit_lineage_resolver: pass\n";
  return 0;
}
