#include "internal/events/event_sink.hpp"

#include "internal/observability/logging.hpp"

namespace graphvc::events {

using graphvc::observability::IntField;
using graphvc::observability::StringField;

void LoggingEventSink::Publish(const graphvc::v1::ObjectChangedEvent& event) {
  std::string paths;
  for (const auto& p : event.changed_paths()) {
    if (!paths.empty()) paths += ",";
    paths += p;
  }

  GRAPHVC_LOG_INFO("object changed", {StringField("object_id", event.object_id()), StringField("canonical_id", event.canonical_id()),
                                      StringField("branch_id", event.branch_id()), StringField("type", event.type()),
                                      IntField("changed", event.changed_paths_size()), StringField("paths", paths)});
}

} // namespace graphvc::events
