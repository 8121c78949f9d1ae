#include "proto_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace graphvc::util {

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid " + std::string(message->GetTypeName()) + " JSON: " + std::string(status.message()));
  }
}

} // namespace graphvc::util
