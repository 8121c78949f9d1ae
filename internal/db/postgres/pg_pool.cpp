#include "pg_pool.hpp"

namespace graphvc::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    std::unique_ptr<pqxx::connection> reused = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(reused.release());
  }

  // reserve the slot, connect outside the lock
  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> opened;
  try {
    opened = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*opened);
  } catch (const std::exception&) {
    Forget();
    throw;
  }
  return Wrap(opened.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("lock_key", "SELECT pg_advisory_xact_lock(hashtext($1))");

  conn.prepare("get_object_version",
               "SELECT id,canonical_id,branch_id,organization_id,project_id,type,key,properties::text,labels::text,version,supersedes_id,"
               "content_hash,change_summary::text,created_at_ms,deleted_at_ms FROM object_versions WHERE id=$1");

  conn.prepare("get_latest_on_branch",
               "SELECT id,canonical_id,branch_id,organization_id,project_id,type,key,properties::text,labels::text,version,supersedes_id,"
               "content_hash,change_summary::text,created_at_ms,deleted_at_ms FROM object_versions WHERE canonical_id=$1 AND branch_id=$2 "
               "ORDER BY version DESC LIMIT 1");

  conn.prepare("get_branch_ancestors",
               "SELECT branch_id,ancestor_branch_id,depth,created_at_ms FROM branch_lineage WHERE branch_id=$1 ORDER BY depth ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  return std::shared_ptr<pqxx::connection>(conn, [pool = weak_from_this()](pqxx::connection* returned) {
    auto self = pool.lock();
    if (!self) {
      delete returned;
      return;
    }
    self->Release(returned);
  });
}

void PgPool::Release(pqxx::connection* conn) {
  // a connection the server dropped is not reused
  if (!conn->is_open()) {
    delete conn;
    Forget();
    return;
  }

  std::lock_guard lock(mutex_);
  idle_.emplace_back(conn);
  cv_.notify_one();
}

void PgPool::Forget() {
  std::lock_guard lock(mutex_);
  --live_connections_;
  cv_.notify_one();
}

} // namespace graphvc::db::postgres
