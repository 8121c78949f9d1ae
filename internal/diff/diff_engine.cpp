#include "internal/diff/diff_engine.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/diff/canonical_json.hpp"
#include "internal/diff/json_pointer.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/sha256.hpp"

namespace graphvc::diff {

using google::protobuf::Struct;
using google::protobuf::Value;

DiffOptions DiffOptions::FromConfig(const graphvc::runtime::config::DiffConfig& config) {
  DiffOptions options;
  if (config.string_truncate_threshold() > 0) options.string_truncate_threshold = config.string_truncate_threshold();
  if (config.object_truncate_threshold() > 0) options.object_truncate_threshold = config.object_truncate_threshold();
  if (config.max_change_summary_bytes() > 0) options.max_change_summary_bytes = config.max_change_summary_bytes();
  if (config.float_tolerance() > 0) options.float_tolerance = config.float_tolerance();
  return options;
}

struct DiffEngine::Collector {
  graphvc::v1::ChangeSummary summary;
  std::set<std::string>      removed;
};

namespace {

Value TruncatedLeaf(const std::string& hash, std::size_t bytes) {
  Value leaf;
  auto& fields = *leaf.mutable_struct_value()->mutable_fields();
  fields["truncated"].set_bool_value(true);
  fields["hash"].set_string_value(hash);
  fields["bytes"].set_number_value(static_cast<double>(bytes));
  return leaf;
}

Value Wrap(const Struct& s) {
  Value v;
  *v.mutable_struct_value() = s;
  return v;
}

} // namespace

DiffEngine::DiffEngine(DiffOptions options) : options_(options) {
}

bool DiffEngine::IsOversized(const Value& value) const {
  return value.has_struct_value() && CanonicalJson(value).size() > options_.object_truncate_threshold;
}

Value DiffEngine::Summarize(const Value& value) const {
  if (value.has_string_value() && value.string_value().size() > options_.string_truncate_threshold) {
    return TruncatedLeaf(util::Sha256Hex(value.string_value()), value.string_value().size());
  }
  if (value.has_struct_value()) {
    auto canonical = CanonicalJson(value);
    if (canonical.size() > options_.object_truncate_threshold) {
      return TruncatedLeaf(util::Sha256Hex(canonical), canonical.size());
    }
  }
  return value;
}

bool DiffEngine::Equal(const Value& a, const Value& b) const {
  const bool a_null = a.has_null_value() || a.kind_case() == Value::KIND_NOT_SET;
  const bool b_null = b.has_null_value() || b.kind_case() == Value::KIND_NOT_SET;
  if (a_null || b_null) return a_null && b_null;
  if (a.kind_case() != b.kind_case()) return false;

  switch (a.kind_case()) {
    case Value::kNumberValue:
      if (options_.float_tolerance > 0) return std::fabs(a.number_value() - b.number_value()) <= options_.float_tolerance;
      return a.number_value() == b.number_value();
    case Value::kBoolValue:
      return a.bool_value() == b.bool_value();
    case Value::kStringValue:
      return a.string_value() == b.string_value();
    case Value::kStructValue: {
      const auto& fa = a.struct_value().fields();
      const auto& fb = b.struct_value().fields();
      if (fa.size() != fb.size()) return false;
      for (const auto& [k, v] : fa) {
        auto it = fb.find(k);
        if (it == fb.end() || !Equal(v, it->second)) return false;
      }
      return true;
    }
    case Value::kListValue: {
      const auto& la = a.list_value().values();
      const auto& lb = b.list_value().values();
      if (la.size() != lb.size()) return false;
      for (int i = 0; i < la.size(); ++i)
        if (!Equal(la.Get(i), lb.Get(i))) return false;
      return true;
    }
    default:
      return false;
  }
}

void DiffEngine::DiffValue(const Value* before, const Value* after, const std::string& path, Collector& out) const {
  if (!before && !after) return;

  if (!before) {
    (*out.summary.mutable_added())[path] = Summarize(*after);
    return;
  }
  if (!after) {
    out.removed.insert(path);
    return;
  }

  // root is always descended so that paths stay addressable
  const bool descend_objects = before->has_struct_value() && after->has_struct_value() && (path.empty() || (!IsOversized(*before) && !IsOversized(*after)));

  if (descend_objects) {
    std::set<std::string> keys;
    for (const auto& [k, _] : before->struct_value().fields()) keys.insert(k);
    for (const auto& [k, _] : after->struct_value().fields()) keys.insert(k);

    for (const auto& k : keys) {
      const auto& bf = before->struct_value().fields();
      const auto& af = after->struct_value().fields();
      auto        bi = bf.find(k);
      auto        ai = af.find(k);
      DiffValue(bi == bf.end() ? nullptr : &bi->second, ai == af.end() ? nullptr : &ai->second, path + "/" + EscapeToken(k), out);
    }
    return;
  }

  if (before->has_list_value() && after->has_list_value()) {
    const auto& bl = before->list_value().values();
    const auto& al = after->list_value().values();
    const int   n  = std::max(bl.size(), al.size());
    for (int i = 0; i < n; ++i) {
      DiffValue(i < bl.size() ? &bl.Get(i) : nullptr, i < al.size() ? &al.Get(i) : nullptr, path + "/" + std::to_string(i), out);
    }
    return;
  }

  if (!Equal(*before, *after)) {
    graphvc::v1::ValueChange change;
    *change.mutable_from() = Summarize(*before);
    *change.mutable_to()   = Summarize(*after);
    (*out.summary.mutable_updated())[path] = std::move(change);
  }
}

graphvc::v1::ChangeSummary DiffEngine::Diff(const Struct& before, const Struct& after) const {
  const auto before_json = CanonicalJson(before);
  const auto after_json  = CanonicalJson(after);

  Collector out;
  auto*     meta = out.summary.mutable_meta();
  meta->set_prop_bytes_before(before_json.size());
  meta->set_prop_bytes_after(after_json.size());

  if (before_json == after_json) {
    return out.summary;
  }

  const auto before_value = Wrap(before);
  const auto after_value  = Wrap(after);
  DiffValue(&before_value, &after_value, "", out);

  std::vector<std::string> paths;
  for (const auto& [p, _] : out.summary.added()) paths.push_back(p);
  for (const auto& p : out.removed) {
    out.summary.add_removed(p);
    paths.push_back(p);
  }
  for (const auto& [p, _] : out.summary.updated()) paths.push_back(p);
  std::sort(paths.begin(), paths.end());
  for (auto& p : paths) out.summary.add_paths(std::move(p));

  meta->set_added(static_cast<uint32_t>(out.summary.added_size()));
  meta->set_removed(static_cast<uint32_t>(out.summary.removed_size()));
  meta->set_updated(static_cast<uint32_t>(out.summary.updated_size()));

  if (options_.max_change_summary_bytes > 0 && util::ToJson(out.summary).size() > options_.max_change_summary_bytes) {
    out.summary.clear_added();
    out.summary.clear_removed();
    out.summary.clear_updated();
    meta->set_elided(true);
  }

  return out.summary;
}

std::vector<std::string> DiffEngine::ChangedPaths(const graphvc::v1::ChangeSummary& summary) {
  return {summary.paths().begin(), summary.paths().end()};
}

void DiffEngine::ApplyPaths(Struct* target, const Struct& source, const std::vector<std::string>& paths) {
  auto       root        = Wrap(*target);
  const auto source_root = Wrap(source);

  std::vector<std::string> sets;
  std::vector<std::string> removes;
  for (const auto& p : paths) {
    if (p.empty()) continue;
    (Lookup(source_root, p) ? sets : removes).push_back(p);
  }

  std::sort(sets.begin(), sets.end(), PointerLess);
  for (const auto& p : sets) {
    if (!Set(&root, p, *Lookup(source_root, p))) {
      throw std::runtime_error("cannot apply " + p + ": a scalar is in the way");
    }
  }

  // deepest / highest index first so earlier removals keep later indices valid
  std::sort(removes.begin(), removes.end(), [](const std::string& a, const std::string& b) { return PointerLess(b, a); });
  // a path already absent on the target is not an error
  for (const auto& p : removes) {
    Remove(&root, p);
  }

  *target = std::move(*root.mutable_struct_value());
}

} // namespace graphvc::diff
