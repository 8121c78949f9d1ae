#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace graphvc::runtime::config {
class ValidationConfig;
}

namespace graphvc::validation {

/*
  Invoked before commit for every live version the store writes.
  Rejection throws util::ValidationError and nothing is persisted.
*/
class SchemaValidator {
 public:
  virtual ~SchemaValidator() = default;

  virtual void Validate(const std::string& type, const google::protobuf::Struct& properties) const = 0;
};

class PermissiveValidator final : public SchemaValidator {
 public:
  void Validate(const std::string&, const google::protobuf::Struct&) const override {
  }
};

// Per-type list of top-level properties that must be present and non-null.
class RequiredPropertiesValidator final : public SchemaValidator {
 public:
  explicit RequiredPropertiesValidator(const graphvc::runtime::config::ValidationConfig& config);

  void Validate(const std::string& type, const google::protobuf::Struct& properties) const override;

 private:
  std::unordered_map<std::string, std::vector<std::string>> required_;
};

std::shared_ptr<SchemaValidator> BuildValidator(const graphvc::runtime::config::ValidationConfig& config);

} // namespace graphvc::validation
