#pragma once

#include <cstdint>
#include <string>

namespace graphvc::db::model {

struct BranchRecord {
  std::string id;
  std::string organization_id;
  std::string project_id;

  // unique per (organization_id, project_id)
  std::string name;

  // "" for a root branch
  std::string parent_branch_id;

  uint64_t created_at_ms = 0;
};

} // namespace graphvc::db::model
