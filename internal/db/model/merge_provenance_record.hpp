#pragma once

#include <cstdint>
#include <string>

namespace graphvc::db::model {

/*
  Audit edge from a merged version to a version that contributed to it.

  parent ---> child
*/

struct MergeProvenanceRecord {
  std::string child_version_id;
  std::string parent_version_id;

  // "target", "source" or "base"
  std::string role;

  uint64_t created_at_ms = 0;
};

} // namespace graphvc::db::model
