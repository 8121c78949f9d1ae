#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "graphvc/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/graph_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

using namespace graphvc::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  graphvcctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "  branch-create <org> <project> <name> [parent_branch_id]\n"
            << "  branch-list <org> <project>\n"
            << "  branch-ancestors <branch_id>\n"
            << "  write <WriteObjectRequest json>\n"
            << "  patch <PatchObjectRequest json>\n"
            << "  delete <object_id>\n"
            << "  restore <object_id>\n"
            << "  get <object_id>\n"
            << "  history <object_id> [limit] [before_version]\n"
            << "  resolve <branch_id> <canonical_id>\n"
            << "  merge <target_branch_id> <source_branch_id> [--execute]\n"
            << "  provenance <version_id>\n";
}

static void Print(const google::protobuf::Message& message) {
  std::cout << graphvc::util::ToJson(message, true) << "\n";
}

template <typename T>
static void PrintLines(const std::vector<T>& messages) {
  for (const auto& m : messages) std::cout << graphvc::util::ToJson(m) << "\n";
}

static int Run(graphvc::service::GraphService& svc, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "branch-create") {
    if (args.size() < 4) return 1;

    CreateBranchRequest req;
    req.set_organization_id(args[1]);
    req.set_project_id(args[2]);
    req.set_name(args[3]);
    if (args.size() >= 5) req.set_parent_branch_id(args[4]);

    Print(svc.CreateBranch(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "branch-list") {
    if (args.size() < 3) return 1;
    PrintLines(svc.ListBranches(args[1], args[2]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "branch-ancestors") {
    if (args.size() < 2) return 1;
    PrintLines(svc.Ancestors(args[1]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "write") {
    if (args.size() < 2) return 1;

    WriteObjectRequest req;
    graphvc::util::FromJson(args[1], &req);
    Print(svc.Write(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "patch") {
    if (args.size() < 2) return 1;

    PatchObjectRequest req;
    graphvc::util::FromJson(args[1], &req);
    Print(svc.Patch(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete" || cmd == "restore" || cmd == "get") {
    if (args.size() < 2) return 1;

    if (cmd == "delete") Print(svc.Delete(args[1]));
    else if (cmd == "restore") Print(svc.Restore(args[1]));
    else Print(svc.Get(args[1]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    if (args.size() < 2) return 1;

    HistoryRequest req;
    req.set_object_id(args[1]);
    if (args.size() >= 3) req.set_limit(static_cast<uint32_t>(std::stoul(args[2])));
    if (args.size() >= 4) req.set_before_version(std::stoull(args[3]));

    Print(svc.History(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (args.size() < 3) return 1;

    auto head = svc.Resolve(args[1], args[2]);
    if (!head) {
      std::cerr << "not visible on branch\n";
      return 2;
    }
    Print(*head);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "merge") {
    if (args.size() < 3) return 1;

    MergeRequest req;
    req.set_target_branch_id(args[1]);
    req.set_source_branch_id(args[2]);
    req.set_mode(args.size() >= 4 && args[3] == "--execute" ? MERGE_MODE_EXECUTE : MERGE_MODE_DRY_RUN);

    Print(svc.Merge(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "provenance") {
    if (args.size() < 2) return 1;

    std::cout << "parents:\n";
    PrintLines(svc.ProvenanceParents(args[1]));
    std::cout << "children:\n";
    PrintLines(svc.ProvenanceChildren(args[1]));
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = config_path.empty() ? graphvc::config::ConfigLoader::Defaults() : graphvc::config::ConfigLoader::LoadFromYaml(config_path);

    graphvc::observability::InitializeTracing(config);
    graphvc::observability::InitializeLogging(config);

    auto app = graphvc::factory::Build(config);

    const int rc = Run(*app.service, args);
    if (rc == 1) Usage();

    graphvc::observability::ShutdownLogging();
    graphvc::observability::ShutdownTracing();
    return rc;
  } catch (const graphvc::util::NotFound& e) {
    std::cerr << "not found: " << e.what() << "\n";
  } catch (const graphvc::util::Conflict& e) {
    std::cerr << "conflict: " << e.what() << "\n";
  } catch (const graphvc::util::ValidationError& e) {
    std::cerr << "invalid: " << e.what() << "\n";
  } catch (const std::exception& e) {
    GRAPHVC_LOG_ERROR("Fatal error", {graphvc::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
  }

  graphvc::observability::ShutdownLogging();
  graphvc::observability::ShutdownTracing();
  return 2;
}
