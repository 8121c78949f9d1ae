#pragma once

#include <cstdint>
#include <string>

namespace graphvc::db::model {

/*
  One immutable version row of a canonical object.

  Structured columns are stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct ObjectVersionRecord {
  std::string id;
  std::string canonical_id;
  std::string branch_id;
  std::string organization_id;
  std::string project_id;

  std::string type;
  std::string key;

  // JSON object
  std::string properties;

  // JSON array of strings
  std::string labels;

  // monotonic per canonical_id across all branches
  uint64_t version = 0;

  // previous version this row was derived from ("" for version 1)
  std::string supersedes_id;

  // hex sha256 of the canonical properties
  std::string content_hash;

  // JSON encoded ChangeSummary
  std::string change_summary;

  uint64_t created_at_ms = 0;

  // 0 = live, otherwise tombstone time (epoch ms)
  uint64_t deleted_at_ms = 0;

  bool IsTombstone() const {
    return deleted_at_ms != 0;
  }
};

} // namespace graphvc::db::model
