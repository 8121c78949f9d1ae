#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <vector>

namespace graphvc::db::sqlite {

using graphvc::db::ErrorCode;
using graphvc::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Step a read statement, throwing on anything but ROW / DONE.
bool NextRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

constexpr const char* kVersionColumns =
    "id,canonical_id,branch_id,organization_id,project_id,type,key,properties,labels,version,supersedes_id,content_hash,change_summary,"
    "created_at_ms,deleted_at_ms";

model::ObjectVersionRecord ReadVersion(sqlite3_stmt* st) {
  model::ObjectVersionRecord r;
  r.id              = ColText(st, 0);
  r.canonical_id    = ColText(st, 1);
  r.branch_id       = ColText(st, 2);
  r.organization_id = ColText(st, 3);
  r.project_id      = ColText(st, 4);
  r.type            = ColText(st, 5);
  r.key             = ColText(st, 6);
  r.properties      = ColText(st, 7);
  r.labels          = ColText(st, 8);
  r.version         = ColU64(st, 9);
  r.supersedes_id   = ColText(st, 10);
  r.content_hash    = ColText(st, 11);
  r.change_summary  = ColText(st, 12);
  r.created_at_ms   = ColU64(st, 13);
  r.deleted_at_ms   = ColU64(st, 14);
  return r;
}

constexpr const char* kBranchColumns = "id,organization_id,project_id,name,parent_branch_id,created_at_ms";

model::BranchRecord ReadBranch(sqlite3_stmt* st) {
  model::BranchRecord r;
  r.id               = ColText(st, 0);
  r.organization_id  = ColText(st, 1);
  r.project_id       = ColText(st, 2);
  r.name             = ColText(st, 3);
  r.parent_branch_id = ColText(st, 4);
  r.created_at_ms    = ColU64(st, 5);
  return r;
}

model::MergeProvenanceRecord ReadProvenance(sqlite3_stmt* st) {
  model::MergeProvenanceRecord r;
  r.child_version_id  = ColText(st, 0);
  r.parent_version_id = ColText(st, 1);
  r.role              = ColText(st, 2);
  r.created_at_ms     = ColU64(st, 3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS branches (id TEXT PRIMARY KEY, organization_id TEXT NOT NULL, project_id TEXT NOT NULL, name TEXT NOT NULL, "
      "parent_branch_id TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, UNIQUE(organization_id, project_id, name));",
      "CREATE TABLE IF NOT EXISTS branch_lineage (branch_id TEXT NOT NULL REFERENCES branches(id), ancestor_branch_id TEXT NOT NULL REFERENCES "
      "branches(id), depth INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (branch_id, ancestor_branch_id));",
      "CREATE TABLE IF NOT EXISTS object_versions (id TEXT PRIMARY KEY, canonical_id TEXT NOT NULL, branch_id TEXT NOT NULL REFERENCES "
      "branches(id), organization_id TEXT NOT NULL, project_id TEXT NOT NULL, type TEXT NOT NULL, key TEXT NOT NULL, properties TEXT NOT NULL, "
      "labels TEXT NOT NULL, version INTEGER NOT NULL, supersedes_id TEXT NOT NULL DEFAULT '', content_hash TEXT NOT NULL, change_summary TEXT "
      "NOT NULL, created_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER NOT NULL DEFAULT 0, UNIQUE(canonical_id, version));",
      "CREATE INDEX IF NOT EXISTS object_versions_branch_idx ON object_versions(canonical_id, branch_id, version);",
      "CREATE INDEX IF NOT EXISTS object_versions_identity_idx ON object_versions(project_id, type, key);",
      "CREATE INDEX IF NOT EXISTS object_versions_on_branch_idx ON object_versions(branch_id);",
      "CREATE TABLE IF NOT EXISTS merge_provenance (child_version_id TEXT NOT NULL REFERENCES object_versions(id), parent_version_id TEXT NOT NULL "
      "REFERENCES object_versions(id), role TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (child_version_id, parent_version_id, "
      "role));",
      "CREATE INDEX IF NOT EXISTS merge_provenance_parent_idx ON merge_provenance(parent_version_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::LockKey(Transaction&, const std::string&) {
  return Result::Ok();
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBranch(Transaction& t, const model::BranchRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO branches(id,organization_id,project_id,name,parent_branch_id,created_at_ms) VALUES(?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.organization_id);
  BindText(st.get(), 3, r.project_id);
  BindText(st.get(), 4, r.name);
  BindText(st.get(), 5, r.parent_branch_id);
  BindU64(st.get(), 6, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BranchRecord> SqliteRepository::GetBranch(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kBranchColumns + " FROM branches WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!NextRow(db, st.get())) return std::nullopt;
  return ReadBranch(st.get());
}

std::optional<model::BranchRecord> SqliteRepository::GetBranchByName(Transaction& t, const std::string& organization_id,
                                                                     const std::string& project_id, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kBranchColumns + " FROM branches WHERE organization_id=? AND project_id=? AND name=?;");
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, project_id);
  BindText(st.get(), 3, name);

  if (!NextRow(db, st.get())) return std::nullopt;
  return ReadBranch(st.get());
}

std::vector<model::BranchRecord> SqliteRepository::ListBranches(Transaction& t, const std::string& organization_id,
                                                                const std::string& project_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kBranchColumns +
                             " FROM branches WHERE organization_id=? AND project_id=? ORDER BY created_at_ms ASC, name ASC;");
  BindText(st.get(), 1, organization_id);
  BindText(st.get(), 2, project_id);

  std::vector<model::BranchRecord> out;
  while (NextRow(db, st.get())) out.push_back(ReadBranch(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Lineage
// ------------------------------------------------------------------

Result SqliteRepository::InsertBranchLineage(Transaction& t, const model::BranchLineageRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO branch_lineage(branch_id,ancestor_branch_id,depth,created_at_ms) VALUES(?,?,?,?);");

  BindText(st.get(), 1, r.branch_id);
  BindText(st.get(), 2, r.ancestor_branch_id);
  BindU64(st.get(), 3, r.depth);
  BindU64(st.get(), 4, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::BranchLineageRecord> SqliteRepository::GetBranchAncestors(Transaction& t, const std::string& branch_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT branch_id,ancestor_branch_id,depth,created_at_ms FROM branch_lineage WHERE branch_id=? ORDER BY depth ASC;");
  BindText(st.get(), 1, branch_id);

  std::vector<model::BranchLineageRecord> out;
  while (NextRow(db, st.get())) {
    model::BranchLineageRecord r;
    r.branch_id          = ColText(st.get(), 0);
    r.ancestor_branch_id = ColText(st.get(), 1);
    r.depth              = static_cast<uint32_t>(ColU64(st.get(), 2));
    r.created_at_ms      = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Object versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertObjectVersion(Transaction& t, const model::ObjectVersionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO object_versions(") + kVersionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.canonical_id);
  BindText(st.get(), 3, r.branch_id);
  BindText(st.get(), 4, r.organization_id);
  BindText(st.get(), 5, r.project_id);
  BindText(st.get(), 6, r.type);
  BindText(st.get(), 7, r.key);
  BindText(st.get(), 8, r.properties);
  BindText(st.get(), 9, r.labels);
  BindU64(st.get(), 10, r.version);
  BindText(st.get(), 11, r.supersedes_id);
  BindText(st.get(), 12, r.content_hash);
  BindText(st.get(), 13, r.change_summary);
  BindU64(st.get(), 14, r.created_at_ms);
  BindU64(st.get(), 15, r.deleted_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ObjectVersionRecord> SqliteRepository::GetObjectVersion(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kVersionColumns + " FROM object_versions WHERE id=?;");
  BindText(st.get(), 1, id);

  if (!NextRow(db, st.get())) return std::nullopt;
  return ReadVersion(st.get());
}

std::optional<model::ObjectVersionRecord> SqliteRepository::GetLatestOnBranch(Transaction& t, const std::string& canonical_id,
                                                                              const std::string& branch_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kVersionColumns +
                             " FROM object_versions WHERE canonical_id=? AND branch_id=? ORDER BY version DESC LIMIT 1;");
  BindText(st.get(), 1, canonical_id);
  BindText(st.get(), 2, branch_id);

  if (!NextRow(db, st.get())) return std::nullopt;
  return ReadVersion(st.get());
}

uint64_t SqliteRepository::GetMaxVersion(Transaction& t, const std::string& canonical_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COALESCE(MAX(version),0) FROM object_versions WHERE canonical_id=?;");
  BindText(st.get(), 1, canonical_id);

  if (!NextRow(db, st.get())) return 0;
  return ColU64(st.get(), 0);
}

std::vector<model::ObjectVersionRecord> SqliteRepository::ListVersions(Transaction& t, const std::string& canonical_id, uint64_t before_version,
                                                                       std::size_t limit) {
  auto* db = TX(t).Handle();

  // LIMIT -1 is unbounded in sqlite
  auto st = Prepare(db, std::string("SELECT ") + kVersionColumns +
                            " FROM object_versions WHERE canonical_id=? AND (?=0 OR version<?) ORDER BY version DESC LIMIT ?;");
  BindText(st.get(), 1, canonical_id);
  BindU64(st.get(), 2, before_version);
  BindU64(st.get(), 3, before_version);
  sqlite3_bind_int64(st.get(), 4, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  std::vector<model::ObjectVersionRecord> out;
  while (NextRow(db, st.get())) out.push_back(ReadVersion(st.get()));
  return out;
}

std::vector<std::string> SqliteRepository::FindCanonicalIds(Transaction& t, const std::string& project_id, const std::string& type,
                                                            const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT DISTINCT canonical_id FROM object_versions WHERE project_id=? AND type=? AND key=? ORDER BY canonical_id;");
  BindText(st.get(), 1, project_id);
  BindText(st.get(), 2, type);
  BindText(st.get(), 3, key);

  std::vector<std::string> out;
  while (NextRow(db, st.get())) out.push_back(ColText(st.get(), 0));
  return out;
}

std::vector<std::string> SqliteRepository::ListCanonicalIdsOnBranches(Transaction& t, const std::vector<std::string>& branch_ids) {
  if (branch_ids.empty()) return {};

  std::string placeholders;
  for (std::size_t i = 0; i < branch_ids.size(); ++i) placeholders += i == 0 ? "?" : ",?";

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT DISTINCT canonical_id FROM object_versions WHERE branch_id IN (" + placeholders + ") ORDER BY canonical_id;");
  for (std::size_t i = 0; i < branch_ids.size(); ++i) BindText(st.get(), static_cast<int>(i + 1), branch_ids[i]);

  std::vector<std::string> out;
  while (NextRow(db, st.get())) out.push_back(ColText(st.get(), 0));
  return out;
}

// ------------------------------------------------------------------
// Merge provenance
// ------------------------------------------------------------------

Result SqliteRepository::InsertMergeProvenance(Transaction& t, const model::MergeProvenanceRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "INSERT INTO merge_provenance(child_version_id,parent_version_id,role,created_at_ms) VALUES(?,?,?,?);");

  BindText(st.get(), 1, r.child_version_id);
  BindText(st.get(), 2, r.parent_version_id);
  BindText(st.get(), 3, r.role);
  BindU64(st.get(), 4, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::MergeProvenanceRecord> SqliteRepository::GetProvenanceParents(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT child_version_id,parent_version_id,role,created_at_ms FROM merge_provenance WHERE child_version_id=? ORDER BY "
                     "rowid ASC;");
  BindText(st.get(), 1, id);

  std::vector<model::MergeProvenanceRecord> out;
  while (NextRow(db, st.get())) out.push_back(ReadProvenance(st.get()));
  return out;
}

std::vector<model::MergeProvenanceRecord> SqliteRepository::GetProvenanceChildren(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT child_version_id,parent_version_id,role,created_at_ms FROM merge_provenance WHERE parent_version_id=? ORDER BY "
                     "rowid ASC;");
  BindText(st.get(), 1, id);

  std::vector<model::MergeProvenanceRecord> out;
  while (NextRow(db, st.get())) out.push_back(ReadProvenance(st.get()));
  return out;
}

} // namespace graphvc::db::sqlite
