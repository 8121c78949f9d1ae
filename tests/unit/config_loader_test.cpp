#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "graphvc_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\graphvc\\\"quoted\"\\db.sqlite"
)");

  auto config = graphvc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\graphvc\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = graphvc::config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: "debug"
  pattern: "123"
tracing:
  service_name: "2024"
)");

  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "123");
  assert(config.tracing().service_name() == "2024");
}

void TestDiffAndValidationSections() {
  auto config = graphvc::config::ConfigLoader::LoadFromYamlString(R"(diff:
  string_truncate_threshold: 64
  object_truncate_threshold: 512
  max_change_summary_bytes: 4096
  float_tolerance: 0.001
validation:
  types:
    - type: Person
      required_properties: [name, email]
    - type: Team
      required_properties: [name]
)");

  assert(config.diff().string_truncate_threshold() == 64);
  assert(config.diff().object_truncate_threshold() == 512);
  assert(config.diff().max_change_summary_bytes() == 4096);
  assert(config.diff().float_tolerance() > 0.0009 && config.diff().float_tolerance() < 0.0011);

  assert(config.validation().types_size() == 2);
  assert(config.validation().types(0).type() == "Person");
  assert(config.validation().types(0).required_properties_size() == 2);
  assert(config.validation().types(0).required_properties(1) == "email");
  assert(config.validation().types(1).type() == "Team");
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = graphvc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  auto defaults = graphvc::config::ConfigLoader::Defaults();
  assert(defaults.database().has_memory());
  assert(defaults.diff().string_truncate_threshold() == 256);
  assert(defaults.diff().object_truncate_threshold() == 2048);
  assert(defaults.diff().max_change_summary_bytes() == 16384);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)graphvc::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonMappingTopLevelIsRejected() {
  bool threw = false;
  try {
    (void)graphvc::config::ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)graphvc::config::ConfigLoader::LoadFromYaml("/nonexistent/graphvc/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

bool Rejects(const std::string& yaml) {
  try {
    (void)graphvc::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestUnusableValuesAreRejected() {
  assert(Rejects("database:\n  sqlite:\n    busy_timeout_ms: 100\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("diff:\n  float_tolerance: -0.5\n"));
  assert(Rejects("logging:\n  level: chatty\n"));
  assert(Rejects("tracing:\n  exporter: zipkin\n"));
  assert(Rejects("tracing:\n  sample_ratio: 1.5\n"));
  assert(Rejects("validation:\n  types:\n    - required_properties: [name]\n"));
  assert(Rejects("validation:\n  types:\n    - type: Person\n      required_properties: [\"\"]\n"));
}

void TestTracingAndSqliteOptions() {
  auto config = graphvc::config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: warn
  file: /tmp/graphvc.log
database:
  sqlite:
    path: /tmp/graphvc.db
    busy_timeout_ms: 250
tracing:
  enabled: true
  exporter: stdout
  sample_ratio: 0.25
)");

  assert(config.logging().file() == "/tmp/graphvc.log");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.tracing().exporter() == "stdout");
  assert(config.tracing().sample_ratio() > 0.24 && config.tracing().sample_ratio() < 0.26);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDiffAndValidationSections();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestNonMappingTopLevelIsRejected();
  TestMissingFileIsReported();
  TestUnusableValuesAreRejected();
  TestTracingAndSqliteOptions();

  std::cout << "graphvc_unit_config_loader: pass\n";
  return 0;
}
