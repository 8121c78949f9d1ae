#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace graphvc::db::memory {

namespace {

// Visit committed rows, then the transaction's own rows. Caller holds the repository mutex.
template <typename Row, typename Fn>
void Scan(const std::vector<Row>& committed, const std::vector<Row>& pending, Fn&& fn) {
  for (const auto& row : committed) fn(row);
  for (const auto& row : pending) fn(row);
}

bool SameBranchName(const model::BranchRecord& a, const model::BranchRecord& b) {
  return a.organization_id == b.organization_id && a.project_id == b.project_id && a.name == b.name;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::string MemoryRepository::FindViolation(const State& committed, const State& pending) {
  for (const auto& b : pending.branches) {
    for (const auto& existing : committed.branches) {
      if (existing.id == b.id) return "duplicate branch id " + b.id;
      if (SameBranchName(existing, b)) return "duplicate branch name " + b.name;
    }
  }
  for (const auto& v : pending.versions) {
    for (const auto& existing : committed.versions) {
      if (existing.id == v.id) return "duplicate version id " + v.id;
      if (existing.canonical_id == v.canonical_id && existing.version == v.version)
        return "duplicate version " + std::to_string(v.version) + " of " + v.canonical_id;
    }
  }
  return {};
}

Result MemoryRepository::LockKey(Transaction& t, const std::string& key) {
  TX(t).HoldKey(key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  Result result = Result::Ok();
  Scan(committed_.branches, tx.Pending().branches, [&](const model::BranchRecord& b) {
    if (!result) return;
    if (b.id == r.id) result = Result::Err(ErrorCode::AlreadyExists, "branch id exists");
    else if (SameBranchName(b, r)) result = Result::Err(ErrorCode::AlreadyExists, "branch name exists");
  });
  if (!result) return result;

  tx.Pending().branches.push_back(r);
  return Result::Ok();
}

std::optional<model::BranchRecord> MemoryRepository::GetBranch(Transaction& t, const std::string& id) {
  std::scoped_lock                   lock(mutex_);
  std::optional<model::BranchRecord> out;
  Scan(committed_.branches, TX(t).Pending().branches, [&](const model::BranchRecord& b) {
    if (b.id == id) out = b;
  });
  return out;
}

std::optional<model::BranchRecord> MemoryRepository::GetBranchByName(Transaction& t, const std::string& organization_id,
                                                                     const std::string& project_id, const std::string& name) {
  std::scoped_lock                   lock(mutex_);
  std::optional<model::BranchRecord> out;
  Scan(committed_.branches, TX(t).Pending().branches, [&](const model::BranchRecord& b) {
    if (b.organization_id == organization_id && b.project_id == project_id && b.name == name) out = b;
  });
  return out;
}

std::vector<model::BranchRecord> MemoryRepository::ListBranches(Transaction& t, const std::string& organization_id,
                                                                const std::string& project_id) {
  std::vector<model::BranchRecord> out;
  {
    std::scoped_lock lock(mutex_);
    Scan(committed_.branches, TX(t).Pending().branches, [&](const model::BranchRecord& b) {
      if (b.organization_id == organization_id && b.project_id == project_id) out.push_back(b);
    });
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.name < b.name;
  });
  return out;
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

Result MemoryRepository::InsertBranchLineage(Transaction& t, const model::BranchLineageRecord& r) {
  TX(t).Pending().lineage.push_back(r);
  return Result::Ok();
}

std::vector<model::BranchLineageRecord> MemoryRepository::GetBranchAncestors(Transaction& t, const std::string& branch_id) {
  std::vector<model::BranchLineageRecord> out;
  {
    std::scoped_lock lock(mutex_);
    Scan(committed_.lineage, TX(t).Pending().lineage, [&](const model::BranchLineageRecord& e) {
      if (e.branch_id == branch_id) out.push_back(e);
    });
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.depth < b.depth; });
  return out;
}

// ------------------------------------------------------------------
// Object versions
// ------------------------------------------------------------------

Result MemoryRepository::InsertObjectVersion(Transaction& t, const model::ObjectVersionRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  Result result = Result::Ok();
  Scan(committed_.versions, tx.Pending().versions, [&](const model::ObjectVersionRecord& v) {
    if (!result) return;
    if (v.id == r.id) result = Result::Err(ErrorCode::AlreadyExists, "version id exists");
    else if (v.canonical_id == r.canonical_id && v.version == r.version)
      result = Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version) + " exists for " + r.canonical_id);
  });
  if (!result) return result;

  tx.Pending().versions.push_back(r);
  return Result::Ok();
}

std::optional<model::ObjectVersionRecord> MemoryRepository::GetObjectVersion(Transaction& t, const std::string& id) {
  std::scoped_lock                          lock(mutex_);
  std::optional<model::ObjectVersionRecord> out;
  Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
    if (v.id == id) out = v;
  });
  return out;
}

std::optional<model::ObjectVersionRecord> MemoryRepository::GetLatestOnBranch(Transaction& t, const std::string& canonical_id,
                                                                              const std::string& branch_id) {
  std::scoped_lock                          lock(mutex_);
  std::optional<model::ObjectVersionRecord> out;
  Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
    if (v.canonical_id != canonical_id || v.branch_id != branch_id) return;
    if (!out || v.version > out->version) out = v;
  });
  return out;
}

uint64_t MemoryRepository::GetMaxVersion(Transaction& t, const std::string& canonical_id) {
  std::scoped_lock lock(mutex_);
  uint64_t         max_version = 0;
  Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
    if (v.canonical_id == canonical_id) max_version = std::max(max_version, v.version);
  });
  return max_version;
}

std::vector<model::ObjectVersionRecord> MemoryRepository::ListVersions(Transaction& t, const std::string& canonical_id,
                                                                       uint64_t before_version, std::size_t limit) {
  std::vector<model::ObjectVersionRecord> out;
  {
    std::scoped_lock lock(mutex_);
    Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
      if (v.canonical_id != canonical_id) return;
      if (before_version != 0 && v.version >= before_version) return;
      out.push_back(v);
    });
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.version > b.version; });
  if (limit != 0 && out.size() > limit) out.resize(limit);
  return out;
}

std::vector<std::string> MemoryRepository::FindCanonicalIds(Transaction& t, const std::string& project_id, const std::string& type,
                                                            const std::string& key) {
  std::set<std::string> ids;
  {
    std::scoped_lock lock(mutex_);
    Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
      if (v.project_id == project_id && v.type == type && v.key == key) ids.insert(v.canonical_id);
    });
  }
  return {ids.begin(), ids.end()};
}

std::vector<std::string> MemoryRepository::ListCanonicalIdsOnBranches(Transaction& t, const std::vector<std::string>& branch_ids) {
  std::set<std::string> wanted(branch_ids.begin(), branch_ids.end());
  std::set<std::string> ids;
  {
    std::scoped_lock lock(mutex_);
    Scan(committed_.versions, TX(t).Pending().versions, [&](const model::ObjectVersionRecord& v) {
      if (wanted.contains(v.branch_id)) ids.insert(v.canonical_id);
    });
  }
  return {ids.begin(), ids.end()};
}

// ------------------------------------------------------------------
// Merge provenance
// ------------------------------------------------------------------

Result MemoryRepository::InsertMergeProvenance(Transaction& t, const model::MergeProvenanceRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  bool duplicate = false;
  Scan(committed_.provenance, tx.Pending().provenance, [&](const model::MergeProvenanceRecord& e) {
    duplicate = duplicate || (e.child_version_id == r.child_version_id && e.parent_version_id == r.parent_version_id && e.role == r.role);
  });
  if (duplicate) return Result::Err(ErrorCode::AlreadyExists, "provenance edge exists");

  tx.Pending().provenance.push_back(r);
  return Result::Ok();
}

std::vector<model::MergeProvenanceRecord> MemoryRepository::GetProvenanceParents(Transaction& t, const std::string& id) {
  std::scoped_lock                          lock(mutex_);
  std::vector<model::MergeProvenanceRecord> out;
  Scan(committed_.provenance, TX(t).Pending().provenance, [&](const model::MergeProvenanceRecord& e) {
    if (e.child_version_id == id) out.push_back(e);
  });
  return out;
}

std::vector<model::MergeProvenanceRecord> MemoryRepository::GetProvenanceChildren(Transaction& t, const std::string& id) {
  std::scoped_lock                          lock(mutex_);
  std::vector<model::MergeProvenanceRecord> out;
  Scan(committed_.provenance, TX(t).Pending().provenance, [&](const model::MergeProvenanceRecord& e) {
    if (e.parent_version_id == id) out.push_back(e);
  });
  return out;
}

} // namespace graphvc::db::memory
