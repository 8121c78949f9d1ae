#pragma once

#include <cstdint>
#include <string>

namespace graphvc::db::model {

/*
  Transitive closure row of "branch was created from".

  Every branch has a self row at depth 0. Rows are written once
  at branch creation and never changed.
*/

struct BranchLineageRecord {
  std::string branch_id;
  std::string ancestor_branch_id;
  uint32_t    depth = 0;

  uint64_t created_at_ms = 0;
};

} // namespace graphvc::db::model
