#include "internal/validation/schema_validator.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using graphvc::runtime::config::ValidationConfig;
using graphvc::validation::BuildValidator;
using graphvc::validation::PermissiveValidator;
using graphvc::validation::RequiredPropertiesValidator;

google::protobuf::Struct Props(std::initializer_list<std::pair<const char*, const char*>> fields) {
  google::protobuf::Struct s;
  for (const auto& [name, value] : fields) (*s.mutable_fields())[name].set_string_value(value);
  return s;
}

bool Rejects(const graphvc::validation::SchemaValidator& validator, const std::string& type, const google::protobuf::Struct& properties) {
  try {
    validator.Validate(type, properties);
  } catch (const graphvc::util::ValidationError&) {
    return true;
  }
  return false;
}

ValidationConfig PersonRequiresName() {
  ValidationConfig config;
  auto*            rule = config.add_types();
  rule->set_type("Person");
  rule->add_required_properties("name");
  return config;
}

void TestEmptyConfigIsPermissive() {
  auto validator = BuildValidator(ValidationConfig{});
  assert(dynamic_cast<PermissiveValidator*>(validator.get()) != nullptr);
  assert(!Rejects(*validator, "Person", google::protobuf::Struct{}));
}

void TestRequiredProperties() {
  RequiredPropertiesValidator validator(PersonRequiresName());

  assert(!Rejects(validator, "Person", Props({{"name", "Ada"}})));
  assert(Rejects(validator, "Person", Props({{"email", "ada@example.org"}})));

  google::protobuf::Struct null_name;
  (*null_name.mutable_fields())["name"].set_null_value(google::protobuf::NULL_VALUE);
  assert(Rejects(validator, "Person", null_name));

  // types without a rule pass through
  assert(!Rejects(validator, "Company", google::protobuf::Struct{}));
}

void TestRulesForOneTypeAccumulate() {
  auto  config = PersonRequiresName();
  auto* extra  = config.add_types();
  extra->set_type("Person");
  extra->add_required_properties("email");

  auto validator = BuildValidator(config);
  assert(Rejects(*validator, "Person", Props({{"name", "Ada"}})));
  assert(!Rejects(*validator, "Person", Props({{"name", "Ada"}, {"email", "ada@example.org"}})));
}

} // namespace

int main() {
  TestEmptyConfigIsPermissive();
  TestRequiredProperties();
  TestRulesForOneTypeAccumulate();

  std::cout << "graphvc_unit_schema_validator: pass\n";
  return 0;
}
