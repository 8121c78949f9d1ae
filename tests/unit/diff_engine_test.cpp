#include "internal/diff/diff_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/diff/json_pointer.hpp"
#include "internal/util/proto_json.hpp"

namespace {

using google::protobuf::Struct;
using graphvc::diff::DiffEngine;
using graphvc::diff::DiffOptions;

Struct Props(const std::string& json) {
  Struct s;
  graphvc::util::FromJson(json, &s);
  return s;
}

std::vector<std::string> Paths(const graphvc::v1::ChangeSummary& summary) {
  return DiffEngine::ChangedPaths(summary);
}

void TestIdenticalTreesAreNoOp() {
  DiffEngine engine;
  const auto summary = engine.Diff(Props(R"({"a":1,"b":{"c":[1,2]}})"), Props(R"({"b":{"c":[1,2]},"a":1})"));
  assert(Paths(summary).empty());
  assert(summary.meta().prop_bytes_before() == summary.meta().prop_bytes_after());
  assert(summary.meta().prop_bytes_before() > 0);
}

void TestAddedRemovedUpdated() {
  DiffEngine engine;
  const auto summary = engine.Diff(Props(R"({"name":"Ada","age":36,"old":true})"), Props(R"({"name":"Ada L","age":36,"email":"a@x"})"));

  assert((Paths(summary) == std::vector<std::string>{"/email", "/name", "/old"}));
  assert(summary.added().at("/email").string_value() == "a@x");
  assert(summary.removed_size() == 1 && summary.removed(0) == "/old");
  assert(summary.updated().at("/name").from().string_value() == "Ada");
  assert(summary.updated().at("/name").to().string_value() == "Ada L");
  assert(summary.meta().added() == 1);
  assert(summary.meta().removed() == 1);
  assert(summary.meta().updated() == 1);
  assert(!summary.meta().elided());
}

void TestNestedObjectsAndListsArePathAddressed() {
  DiffEngine engine;
  const auto summary =
      engine.Diff(Props(R"({"address":{"city":"Paris","zip":"75001"},"tags":["a","b"]})"), Props(R"({"address":{"city":"Lyon","zip":"75001"},"tags":["a","c","d"]})"));

  assert((Paths(summary) == std::vector<std::string>{"/address/city", "/tags/1", "/tags/2"}));
  assert(summary.added().contains("/tags/2"));
  assert(summary.updated().contains("/tags/1"));
}

void TestTypeChangeIsUpdate() {
  DiffEngine engine;
  const auto summary = engine.Diff(Props(R"({"v":{"x":1}})"), Props(R"({"v":"flat"})"));
  assert((Paths(summary) == std::vector<std::string>{"/v"}));
  assert(summary.updated().at("/v").from().has_struct_value());
  assert(summary.updated().at("/v").to().string_value() == "flat");
}

void TestKeysNeedingEscape() {
  DiffEngine engine;
  const auto summary = engine.Diff(Props(R"({})"), Props(R"({"a/b":1,"c~d":2})"));
  assert((Paths(summary) == std::vector<std::string>{"/a~1b", "/c~0d"}));
}

void TestLongStringsAreTruncated() {
  DiffOptions options;
  options.string_truncate_threshold = 8;
  DiffEngine engine(options);

  const auto summary = engine.Diff(Props(R"({"bio":"short"})"), Props(R"({"bio":"a much longer biography"})"));
  const auto& change  = summary.updated().at("/bio");
  assert(change.from().string_value() == "short");
  assert(change.to().has_struct_value());
  const auto& leaf = change.to().struct_value().fields();
  assert(leaf.at("truncated").bool_value());
  assert(leaf.at("bytes").number_value() == 23);
  assert(leaf.at("hash").string_value().size() == 64);
}

void TestOversizedObjectsCompareAsOneLeaf() {
  DiffOptions options;
  options.object_truncate_threshold = 16;
  DiffEngine engine(options);

  const auto summary = engine.Diff(Props(R"({"blob":{"aaaa":1,"bbbb":2,"cccc":3}})"), Props(R"({"blob":{"aaaa":1,"bbbb":2,"cccc":4}})"));
  assert((Paths(summary) == std::vector<std::string>{"/blob"}));
  assert(summary.updated().at("/blob").to().struct_value().fields().at("truncated").bool_value());
}

void TestOversizedSummaryIsElided() {
  DiffOptions options;
  options.max_change_summary_bytes = 64;
  DiffEngine engine(options);

  const auto summary = engine.Diff(Props(R"({})"), Props(R"({"a":"1111111111","b":"2222222222","c":"3333333333","d":"4444444444"})"));
  assert(summary.meta().elided());
  assert(summary.paths_size() == 4);
  assert(summary.added().empty());
  assert(summary.meta().added() == 4);
}

void TestFloatTolerance() {
  DiffOptions options;
  options.float_tolerance = 0.01;
  DiffEngine engine(options);

  assert(Paths(engine.Diff(Props(R"({"x":1.000})"), Props(R"({"x":1.005})"))).empty());
  assert(!Paths(engine.Diff(Props(R"({"x":1.0})"), Props(R"({"x":1.5})"))).empty());
}

void TestOptionsFromConfigKeepDefaultsForZero() {
  graphvc::runtime::config::DiffConfig config;
  config.set_string_truncate_threshold(10);

  const auto options = DiffOptions::FromConfig(config);
  assert(options.string_truncate_threshold == 10);
  assert(options.object_truncate_threshold == 2048);
  assert(options.max_change_summary_bytes == 16384);
  assert(options.float_tolerance == 0.0);
}

void TestApplyPaths() {
  auto       target = Props(R"({"name":"Ada","age":36,"tags":["x"],"gone":1})");
  const auto source = Props(R"({"name":"Ada","age":37,"address":{"city":"Paris"},"tags":["x","y"]})");

  DiffEngine::ApplyPaths(&target, source, {"/age", "/address/city", "/tags/1", "/gone"});

  const auto expected = Props(R"({"name":"Ada","age":37,"address":{"city":"Paris"},"tags":["x","y"]})");
  DiffEngine engine;
  assert(Paths(engine.Diff(target, expected)).empty());
}

void TestApplyPathsThroughScalarThrows() {
  auto       target = Props(R"({"a":1})");
  const auto source = Props(R"({"a":{"b":2}})");

  bool threw = false;
  try {
    DiffEngine::ApplyPaths(&target, source, {"/a/b"});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIdenticalTreesAreNoOp();
  TestAddedRemovedUpdated();
  TestNestedObjectsAndListsArePathAddressed();
  TestTypeChangeIsUpdate();
  TestKeysNeedingEscape();
  TestLongStringsAreTruncated();
  TestOversizedObjectsCompareAsOneLeaf();
  TestOversizedSummaryIsElided();
  TestFloatTolerance();
  TestOptionsFromConfigKeepDefaultsForZero();
  TestApplyPaths();
  TestApplyPathsThroughScalarThrows();

  std::cout << "graphvc_unit_diff_engine: pass\n";
  return 0;
}
