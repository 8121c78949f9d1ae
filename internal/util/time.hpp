#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace graphvc::util {

// Records store wall-clock milliseconds since the Unix epoch.
uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

} // namespace graphvc::util
