#pragma once

#include <memory>

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

/*
  Dependency container shared by the service facade.
*/
struct ServiceContext {
  std::shared_ptr<graphvc::lineage::LineageResolver>       lineage;
  std::shared_ptr<graphvc::store::ObjectStore>             store;
  std::shared_ptr<graphvc::merge::MergeEngine>             merge;
  std::shared_ptr<graphvc::provenance::ProvenanceRecorder> provenance;
};

} // namespace graphvc::service
