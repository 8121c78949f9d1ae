#include "graph_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/lineage/lineage_resolver.hpp"
#include "internal/merge/merge_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provenance/provenance_recorder.hpp"
#include "internal/store/object_store.hpp"
#include "internal/util/errors.hpp"

namespace graphvc::service {

using namespace graphvc::v1;
using graphvc::observability::IntField;
using graphvc::observability::StringField;

namespace {

template <typename Fn>
auto ObserveOp(std::string_view route, std::string_view subject, Fn&& fn) {
  graphvc::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("graphvc.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      GRAPHVC_LOG_DEBUG("operation completed", {StringField("route", route), IntField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      GRAPHVC_LOG_DEBUG("operation completed", {StringField("route", route), IntField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    const auto* kind = util::ErrorKind(ex);
    span.RecordError(kind, ex.what());
    // expected outcomes (misses, conflicts, bad input) stay below error level
    const auto level = std::string_view(kind) == "internal" ? spdlog::level::err : spdlog::level::info;
    graphvc::observability::Log(level, "operation failed", {StringField("route", route), StringField("subject", subject), StringField("kind", kind),
                                                            StringField("error", ex.what()), IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

GraphService::GraphService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Branches
// ------------------------------------------------------------------

Branch GraphService::CreateBranch(const CreateBranchRequest& req) {
  return ObserveOp("GraphService.CreateBranch", req.name(), [&] { return ctx_.lineage->CreateBranch(req); });
}

Branch GraphService::GetBranch(const std::string& branch_id) {
  return ObserveOp("GraphService.GetBranch", branch_id, [&] {
    auto branch = ctx_.lineage->GetBranch(branch_id);
    if (!branch) throw util::NotFound("branch not found: " + branch_id);
    return *branch;
  });
}

std::vector<Branch> GraphService::ListBranches(const std::string& organization_id, const std::string& project_id) {
  return ObserveOp("GraphService.ListBranches", project_id, [&] { return ctx_.lineage->ListBranches(organization_id, project_id); });
}

std::vector<BranchAncestor> GraphService::Ancestors(const std::string& branch_id) {
  return ObserveOp("GraphService.Ancestors", branch_id, [&] { return ctx_.lineage->Ancestors(branch_id); });
}

// ------------------------------------------------------------------
// Objects
// ------------------------------------------------------------------

ObjectVersion GraphService::Write(const WriteObjectRequest& req) {
  return ObserveOp("GraphService.Write", req.key(), [&] { return ctx_.store->Write(req); });
}

ObjectVersion GraphService::Patch(const PatchObjectRequest& req) {
  return ObserveOp("GraphService.Patch", req.object_id(), [&] { return ctx_.store->Patch(req); });
}

ObjectVersion GraphService::Delete(const std::string& object_id) {
  return ObserveOp("GraphService.Delete", object_id, [&] { return ctx_.store->SoftDelete(object_id); });
}

ObjectVersion GraphService::Restore(const std::string& object_id) {
  return ObserveOp("GraphService.Restore", object_id, [&] { return ctx_.store->Restore(object_id); });
}

ObjectVersion GraphService::Get(const std::string& object_id) {
  return ObserveOp("GraphService.Get", object_id, [&] { return ctx_.store->Get(object_id); });
}

HistoryResponse GraphService::History(const HistoryRequest& req) {
  return ObserveOp("GraphService.History", req.object_id(), [&] { return ctx_.store->History(req); });
}

std::optional<ObjectVersion> GraphService::Resolve(const std::string& branch_id, const std::string& canonical_id) {
  return ObserveOp("GraphService.Resolve", canonical_id, [&] { return ctx_.store->Resolve(branch_id, canonical_id); });
}

// ------------------------------------------------------------------
// Merge / provenance
// ------------------------------------------------------------------

MergeSummary GraphService::Merge(const MergeRequest& req) {
  return ObserveOp("GraphService.Merge", req.source_branch_id(), [&] { return ctx_.merge->Merge(req); });
}

std::vector<MergeProvenanceEdge> GraphService::ProvenanceParents(const std::string& version_id) {
  return ObserveOp("GraphService.ProvenanceParents", version_id, [&] { return ctx_.provenance->Parents(version_id); });
}

std::vector<MergeProvenanceEdge> GraphService::ProvenanceChildren(const std::string& version_id) {
  return ObserveOp("GraphService.ProvenanceChildren", version_id, [&] { return ctx_.provenance->Children(version_id); });
}

} // namespace graphvc::service
