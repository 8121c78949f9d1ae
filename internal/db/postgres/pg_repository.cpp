#include "pg_repository.hpp"

namespace graphvc::db::postgres {

namespace {

constexpr const char* kVersionColumns =
    "id,canonical_id,branch_id,organization_id,project_id,type,key,properties::text,labels::text,version,supersedes_id,content_hash,"
    "change_summary::text,created_at_ms,deleted_at_ms";

constexpr const char* kBranchColumns = "id,organization_id,project_id,name,parent_branch_id,created_at_ms";

model::ObjectVersionRecord ReadVersion(const pqxx::row& row) {
  model::ObjectVersionRecord r;
  r.id              = row[0].c_str();
  r.canonical_id    = row[1].c_str();
  r.branch_id       = row[2].c_str();
  r.organization_id = row[3].c_str();
  r.project_id      = row[4].c_str();
  r.type            = row[5].c_str();
  r.key             = row[6].c_str();
  r.properties      = row[7].c_str();
  r.labels          = row[8].c_str();
  r.version         = row[9].as<uint64_t>();
  r.supersedes_id   = row[10].c_str();
  r.content_hash    = row[11].c_str();
  r.change_summary  = row[12].c_str();
  r.created_at_ms   = row[13].as<uint64_t>();
  r.deleted_at_ms   = row[14].as<uint64_t>();
  return r;
}

model::BranchRecord ReadBranch(const pqxx::row& row) {
  model::BranchRecord r;
  r.id               = row[0].c_str();
  r.organization_id  = row[1].c_str();
  r.project_id       = row[2].c_str();
  r.name             = row[3].c_str();
  r.parent_branch_id = row[4].c_str();
  r.created_at_ms    = row[5].as<uint64_t>();
  return r;
}

model::MergeProvenanceRecord ReadProvenance(const pqxx::row& row) {
  model::MergeProvenanceRecord r;
  r.child_version_id  = row[0].c_str();
  r.parent_version_id = row[1].c_str();
  r.role              = row[2].c_str();
  r.created_at_ms     = row[3].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS branches (id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, project_id TEXT NOT NULL, name TEXT NOT NULL, "
      "parent_branch_id TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, UNIQUE(organization_id, project_id, name));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS branch_lineage (branch_id TEXT NOT NULL REFERENCES branches(id), ancestor_branch_id TEXT NOT NULL REFERENCES "
      "branches(id), depth INTEGER NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (branch_id, ancestor_branch_id));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS object_versions (id TEXT PRIMARY KEY, canonical_id TEXT NOT NULL, branch_id TEXT NOT NULL REFERENCES "
      "branches(id), organization_id TEXT NOT NULL, project_id TEXT NOT NULL, type TEXT NOT NULL, key TEXT NOT NULL, properties JSONB NOT NULL, "
      "labels JSONB NOT NULL, version BIGINT NOT NULL, supersedes_id TEXT NOT NULL DEFAULT '', content_hash TEXT NOT NULL, change_summary "
      "JSONB NOT NULL, created_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT NOT NULL DEFAULT 0, UNIQUE(canonical_id, version));");
  tx.exec("CREATE INDEX IF NOT EXISTS object_versions_branch_idx ON object_versions(canonical_id, branch_id, version);");
  tx.exec("CREATE INDEX IF NOT EXISTS object_versions_identity_idx ON object_versions(project_id, type, key);");
  tx.exec("CREATE INDEX IF NOT EXISTS object_versions_on_branch_idx ON object_versions(branch_id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS merge_provenance (child_version_id TEXT NOT NULL REFERENCES object_versions(id), parent_version_id TEXT NOT "
      "NULL REFERENCES object_versions(id), role TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (child_version_id, "
      "parent_version_id, role));");
  tx.exec("CREATE INDEX IF NOT EXISTS merge_provenance_parent_idx ON merge_provenance(parent_version_id);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::LockKey(Transaction& t, const std::string& key) {
  try {
    TX(t).Work().exec_prepared("lock_key", key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result PgRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO branches(id,organization_id,project_id,name,parent_branch_id,created_at_ms) VALUES($1,$2,$3,$4,$5,$6);",
                             r.id, r.organization_id, r.project_id, r.name, r.parent_branch_id, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BranchRecord> PgRepository::GetBranch(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kBranchColumns + " FROM branches WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadBranch(res[0]);
}

std::optional<model::BranchRecord> PgRepository::GetBranchByName(Transaction& t, const std::string& organization_id, const std::string& project_id,
                                                                 const std::string& name) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kBranchColumns + " FROM branches WHERE organization_id=$1 AND project_id=$2 AND name=$3;",
                                      organization_id, project_id, name);
  if (res.empty()) return std::nullopt;
  return ReadBranch(res[0]);
}

std::vector<model::BranchRecord> PgRepository::ListBranches(Transaction& t, const std::string& organization_id, const std::string& project_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kBranchColumns + " FROM branches WHERE organization_id=$1 AND project_id=$2 ORDER BY created_at_ms ASC, name ASC;",
      organization_id, project_id);

  std::vector<model::BranchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBranch(row));
  return out;
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

Result PgRepository::InsertBranchLineage(Transaction& t, const model::BranchLineageRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO branch_lineage(branch_id,ancestor_branch_id,depth,created_at_ms) VALUES($1,$2,$3,$4);", r.branch_id,
                             r.ancestor_branch_id, r.depth, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BranchLineageRecord> PgRepository::GetBranchAncestors(Transaction& t, const std::string& branch_id) {
  auto res = TX(t).Work().exec_prepared("get_branch_ancestors", branch_id);

  std::vector<model::BranchLineageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::BranchLineageRecord r;
    r.branch_id          = row[0].c_str();
    r.ancestor_branch_id = row[1].c_str();
    r.depth              = row[2].as<uint32_t>();
    r.created_at_ms      = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Object versions
// ------------------------------------------------------------------

Result PgRepository::InsertObjectVersion(Transaction& t, const model::ObjectVersionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO object_versions(id,canonical_id,branch_id,organization_id,project_id,type,key,properties,labels,version,supersedes_id,"
        "content_hash,change_summary,created_at_ms,deleted_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8::jsonb,$9::jsonb,$10,$11,$12,$13::jsonb,$14,$15);",
        r.id, r.canonical_id, r.branch_id, r.organization_id, r.project_id, r.type, r.key, r.properties, r.labels, r.version, r.supersedes_id,
        r.content_hash, r.change_summary, r.created_at_ms, r.deleted_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ObjectVersionRecord> PgRepository::GetObjectVersion(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_object_version", id);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::optional<model::ObjectVersionRecord> PgRepository::GetLatestOnBranch(Transaction& t, const std::string& canonical_id,
                                                                          const std::string& branch_id) {
  auto res = TX(t).Work().exec_prepared("get_latest_on_branch", canonical_id, branch_id);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

uint64_t PgRepository::GetMaxVersion(Transaction& t, const std::string& canonical_id) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(MAX(version),0) FROM object_versions WHERE canonical_id=$1;", canonical_id);
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

std::vector<model::ObjectVersionRecord> PgRepository::ListVersions(Transaction& t, const std::string& canonical_id, uint64_t before_version,
                                                                   std::size_t limit) {
  const std::string sql = std::string("SELECT ") + kVersionColumns +
                          " FROM object_versions WHERE canonical_id=$1 AND ($2::bigint=0 OR version<$2::bigint) ORDER BY version DESC LIMIT " +
                          (limit == 0 ? std::string("ALL") : std::to_string(limit)) + ";";
  auto res = TX(t).Work().exec_params(sql, canonical_id, before_version);

  std::vector<model::ObjectVersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadVersion(row));
  return out;
}

std::vector<std::string> PgRepository::FindCanonicalIds(Transaction& t, const std::string& project_id, const std::string& type,
                                                        const std::string& key) {
  auto res = TX(t).Work().exec_params(
      "SELECT DISTINCT canonical_id FROM object_versions WHERE project_id=$1 AND type=$2 AND key=$3 ORDER BY canonical_id;", project_id, type, key);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

std::vector<std::string> PgRepository::ListCanonicalIdsOnBranches(Transaction& t, const std::vector<std::string>& branch_ids) {
  if (branch_ids.empty()) return {};

  auto res = TX(t).Work().exec_params(
      "SELECT DISTINCT canonical_id FROM object_versions WHERE branch_id = ANY($1::text[]) ORDER BY canonical_id;", branch_ids);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

// ------------------------------------------------------------------
// Merge provenance
// ------------------------------------------------------------------

Result PgRepository::InsertMergeProvenance(Transaction& t, const model::MergeProvenanceRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO merge_provenance(child_version_id,parent_version_id,role,created_at_ms) VALUES($1,$2,$3,$4);",
                             r.child_version_id, r.parent_version_id, r.role, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MergeProvenanceRecord> PgRepository::GetProvenanceParents(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT child_version_id,parent_version_id,role,created_at_ms FROM merge_provenance WHERE child_version_id=$1 ORDER BY created_at_ms, role;",
      id);

  std::vector<model::MergeProvenanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadProvenance(row));
  return out;
}

std::vector<model::MergeProvenanceRecord> PgRepository::GetProvenanceChildren(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT child_version_id,parent_version_id,role,created_at_ms FROM merge_provenance WHERE parent_version_id=$1 ORDER BY created_at_ms, "
      "child_version_id;",
      id);

  std::vector<model::MergeProvenanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadProvenance(row));
  return out;
}

} // namespace graphvc::db::postgres
