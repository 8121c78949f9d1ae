#include "internal/diff/canonical_json.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "internal/util/sha256.hpp"

namespace graphvc::diff {

namespace {

constexpr double kMaxSafeInteger = 9007199254740992.0; // 2^53

void AppendValue(const google::protobuf::Value& value, std::string& out);

void AppendString(const std::string& s, std::string& out) {
  out.push_back('"');
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(double d, std::string& out) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  if (d == std::floor(d) && std::fabs(d) < kMaxSafeInteger) {
    out += fmt::format("{}", static_cast<long long>(d));
    return;
  }
  out += fmt::format("{}", d);
}

void AppendStruct(const google::protobuf::Struct& s, std::string& out) {
  std::vector<const std::string*> keys;
  keys.reserve(s.fields_size());
  for (const auto& [k, _] : s.fields()) keys.push_back(&k);
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* k : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendString(*k, out);
    out.push_back(':');
    AppendValue(s.fields().at(*k), out);
  }
  out.push_back('}');
}

void AppendValue(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(value.number_value(), out);
      break;
    case google::protobuf::Value::kStringValue:
      AppendString(value.string_value(), out);
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(value.struct_value(), out);
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(item, out);
      }
      out.push_back(']');
      break;
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
    default:
      out += "null";
  }
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendValue(value, out);
  return out;
}

std::string CanonicalJson(const google::protobuf::Struct& value) {
  std::string out;
  AppendStruct(value, out);
  return out;
}

std::string ContentHash(const google::protobuf::Struct& properties) {
  return util::Sha256Hex(CanonicalJson(properties));
}

} // namespace graphvc::diff
