#include "time.hpp"

#include <chrono>

namespace graphvc::util {

uint64_t NowMillis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

} // namespace graphvc::util
