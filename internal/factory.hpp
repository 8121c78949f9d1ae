#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace graphvc::events {
class EventSink;
}
namespace graphvc::lineage {
class LineageResolver;
}
namespace graphvc::store {
class ObjectStore;
}
namespace graphvc::merge {
class MergeEngine;
}
namespace graphvc::provenance {
class ProvenanceRecorder;
}
namespace graphvc::service {
class GraphService;
}

namespace graphvc::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<lineage::LineageResolver>       lineage;
  std::shared_ptr<store::ObjectStore>             store;
  std::shared_ptr<provenance::ProvenanceRecorder> provenance;
  std::shared_ptr<merge::MergeEngine>             merge;
  std::shared_ptr<service::GraphService>          service;
};

// Concrete backend for config.database(); creates the schema when needed.
std::shared_ptr<db::Repository> BuildRepository(const graphvc::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete backend types.
  A null `events` installs the logging sink.
*/
Application Build(const graphvc::runtime::config::RuntimeConfig& config, std::shared_ptr<events::EventSink> events = nullptr);

} // namespace graphvc::factory
