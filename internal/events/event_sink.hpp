#pragma once

#include "graphvc/v1.hpp"

namespace graphvc::events {

/*
  Receives ObjectChangedEvent after the producing transaction commits.
  Delivery is best effort: a sink failure never undoes a write.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const graphvc::v1::ObjectChangedEvent& event) = 0;
};

class LoggingEventSink final : public EventSink {
 public:
  void Publish(const graphvc::v1::ObjectChangedEvent& event) override;
};

} // namespace graphvc::events
