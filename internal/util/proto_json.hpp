#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace graphvc::util {

// Protobuf JSON printer; throws std::runtime_error on failure.
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Strict parse into `message` (unknown fields rejected); throws std::runtime_error.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace graphvc::util
