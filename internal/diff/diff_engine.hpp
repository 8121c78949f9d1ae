#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "graphvc/v1.hpp"

namespace graphvc::runtime::config {
class DiffConfig;
}

namespace graphvc::diff {

struct DiffOptions {
  // strings longer than this are summarized as {truncated, hash, bytes}
  std::size_t string_truncate_threshold = 256;

  // nested objects whose canonical JSON exceeds this are compared as one leaf
  std::size_t object_truncate_threshold = 2048;

  // summaries larger than this keep only `paths` (0 = unlimited)
  std::size_t max_change_summary_bytes = 16384;

  // numbers within this distance compare equal
  double float_tolerance = 0.0;

  static DiffOptions FromConfig(const graphvc::runtime::config::DiffConfig& config);
};

/*
  Structured, path addressed difference of two property trees.

  Objects are compared key by key, arrays positionally. A change of
  type is an update. Absent and empty trees are equivalent.
*/
class DiffEngine {
 public:
  explicit DiffEngine(DiffOptions options = {});

  graphvc::v1::ChangeSummary Diff(const google::protobuf::Struct& before, const google::protobuf::Struct& after) const;

  const DiffOptions& Options() const {
    return options_;
  }

  static std::vector<std::string> ChangedPaths(const graphvc::v1::ChangeSummary& summary);

  // Overlay `paths` of `source` onto `target`: present paths are set, absent ones removed.
  static void ApplyPaths(google::protobuf::Struct* target, const google::protobuf::Struct& source, const std::vector<std::string>& paths);

 private:
  struct Collector;

  void DiffValue(const google::protobuf::Value* before, const google::protobuf::Value* after, const std::string& path, Collector& out) const;
  bool Equal(const google::protobuf::Value& a, const google::protobuf::Value& b) const;
  bool IsOversized(const google::protobuf::Value& value) const;

  google::protobuf::Value Summarize(const google::protobuf::Value& value) const;

  DiffOptions options_;
};

} // namespace graphvc::diff
