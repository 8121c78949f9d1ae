#include "internal/diff/canonical_json.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/proto_json.hpp"

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;
using graphvc::diff::CanonicalJson;
using graphvc::diff::ContentHash;

Struct Props(const std::string& json) {
  Struct s;
  graphvc::util::FromJson(json, &s);
  return s;
}

void TestKeysAreSortedAndWhitespaceDropped() {
  const auto s = Props(R"({ "zeta": 1, "alpha": { "b": true, "a": null }, "mid": [3, "x"] })");
  assert(CanonicalJson(s) == R"({"alpha":{"a":null,"b":true},"mid":[3,"x"],"zeta":1})");
}

void TestKeyOrderDoesNotChangeHash() {
  const auto a = Props(R"({"name":"Ada","age":36})");
  const auto b = Props(R"({"age":36,"name":"Ada"})");
  assert(ContentHash(a) == ContentHash(b));
  assert(ContentHash(a) != ContentHash(Props(R"({"age":37,"name":"Ada"})")));
}

void TestNumbers() {
  Value v;
  v.set_number_value(42.0);
  assert(CanonicalJson(v) == "42");

  v.set_number_value(-7.0);
  assert(CanonicalJson(v) == "-7");

  v.set_number_value(1.5);
  assert(CanonicalJson(v) == "1.5");

  v.set_number_value(std::numeric_limits<double>::infinity());
  assert(CanonicalJson(v) == "null");

  v.set_number_value(std::nan(""));
  assert(CanonicalJson(v) == "null");
}

void TestStringEscaping() {
  Value v;
  v.set_string_value("a\"b\\c\nd\x01");
  assert(CanonicalJson(v) == "\"a\\\"b\\\\c\\nd\\u0001\"");
}

void TestEmptyTreeHashesLikeEmptyObject() {
  assert(CanonicalJson(Struct{}) == "{}");
  assert(ContentHash(Struct{}) == "44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a");
}

} // namespace

int main() {
  TestKeysAreSortedAndWhitespaceDropped();
  TestKeyOrderDoesNotChangeHash();
  TestNumbers();
  TestStringEscaping();
  TestEmptyTreeHashesLikeEmptyObject();

  std::cout << "graphvc_unit_canonical_json: pass\n";
  return 0;
}
