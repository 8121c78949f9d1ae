#include "internal/validation/schema_validator.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace graphvc::validation {

RequiredPropertiesValidator::RequiredPropertiesValidator(const graphvc::runtime::config::ValidationConfig& config) {
  for (const auto& rule : config.types()) {
    auto& required = required_[rule.type()];
    required.insert(required.end(), rule.required_properties().begin(), rule.required_properties().end());
  }
}

void RequiredPropertiesValidator::Validate(const std::string& type, const google::protobuf::Struct& properties) const {
  auto it = required_.find(type);
  if (it == required_.end()) return;

  for (const auto& name : it->second) {
    auto field = properties.fields().find(name);
    if (field == properties.fields().end() || field->second.has_null_value()) {
      throw util::ValidationError(type + ": missing required property '" + name + "'");
    }
  }
}

std::shared_ptr<SchemaValidator> BuildValidator(const graphvc::runtime::config::ValidationConfig& config) {
  if (config.types_size() == 0) {
    return std::make_shared<PermissiveValidator>();
  }
  return std::make_shared<RequiredPropertiesValidator>(config);
}

} // namespace graphvc::validation
