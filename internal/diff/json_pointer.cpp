#include "internal/diff/json_pointer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

namespace graphvc::diff {

namespace {

bool ParseIndex(const std::string& token, std::size_t* index) {
  if (token.empty() || token.size() > 18) return false;
  if (token.size() > 1 && token[0] == '0') return false;
  for (char c : token)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  *index = static_cast<std::size_t>(std::strtoull(token.c_str(), nullptr, 10));
  return true;
}

google::protobuf::Value* Child(google::protobuf::Value* node, const std::string& token, bool create) {
  if (node->has_struct_value() || (create && node->kind_case() == google::protobuf::Value::KIND_NOT_SET)) {
    auto* fields = node->mutable_struct_value()->mutable_fields();
    auto  it     = fields->find(token);
    if (it != fields->end()) return &it->second;
    if (!create) return nullptr;
    return &(*fields)[token];
  }

  if (node->has_list_value()) {
    std::size_t index = 0;
    if (!ParseIndex(token, &index)) return nullptr;
    auto* list = node->mutable_list_value();
    if (index < static_cast<std::size_t>(list->values_size())) return list->mutable_values(static_cast<int>(index));
    if (!create) return nullptr;
    while (static_cast<std::size_t>(list->values_size()) <= index) {
      list->add_values()->set_null_value(google::protobuf::NULL_VALUE);
    }
    return list->mutable_values(static_cast<int>(index));
  }

  return nullptr;
}

} // namespace

std::string EscapeToken(std::string_view token) {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string UnescapeToken(std::string_view token) {
  std::string out;
  out.reserve(token.size());
  for (std::size_t i = 0; i < token.size(); ++i) {
    if (token[i] == '~' && i + 1 < token.size()) {
      if (token[i + 1] == '0') {
        out.push_back('~');
        ++i;
        continue;
      }
      if (token[i + 1] == '1') {
        out.push_back('/');
        ++i;
        continue;
      }
    }
    out.push_back(token[i]);
  }
  return out;
}

std::vector<std::string> SplitPointer(std::string_view pointer) {
  std::vector<std::string> tokens;
  if (pointer.empty()) return tokens;

  // tolerate a missing leading slash
  std::size_t start = pointer.front() == '/' ? 1 : 0;
  for (;;) {
    const auto next = pointer.find('/', start);
    tokens.push_back(UnescapeToken(pointer.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start)));
    if (next == std::string_view::npos) break;
    start = next + 1;
  }
  return tokens;
}

const google::protobuf::Value* Lookup(const google::protobuf::Value& root, std::string_view pointer) {
  const google::protobuf::Value* node = &root;
  for (const auto& token : SplitPointer(pointer)) {
    if (node->has_struct_value()) {
      const auto& fields = node->struct_value().fields();
      auto        it     = fields.find(token);
      if (it == fields.end()) return nullptr;
      node = &it->second;
    } else if (node->has_list_value()) {
      std::size_t index = 0;
      if (!ParseIndex(token, &index) || index >= static_cast<std::size_t>(node->list_value().values_size())) return nullptr;
      node = &node->list_value().values(static_cast<int>(index));
    } else {
      return nullptr;
    }
  }
  return node;
}

bool Set(google::protobuf::Value* root, std::string_view pointer, const google::protobuf::Value& value) {
  auto tokens = SplitPointer(pointer);
  if (tokens.empty()) {
    *root = value;
    return true;
  }

  google::protobuf::Value* node = root;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    node = Child(node, tokens[i], true);
    if (!node) return false;
  }
  *node = value;
  return true;
}

bool Remove(google::protobuf::Value* root, std::string_view pointer) {
  auto tokens = SplitPointer(pointer);
  if (tokens.empty()) return false;

  google::protobuf::Value* parent = root;
  for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
    parent = Child(parent, tokens[i], false);
    if (!parent) return false;
  }

  const auto& last = tokens.back();
  if (parent->has_struct_value()) {
    return parent->mutable_struct_value()->mutable_fields()->erase(last) > 0;
  }
  if (parent->has_list_value()) {
    std::size_t index = 0;
    auto*       list  = parent->mutable_list_value();
    if (!ParseIndex(last, &index) || index >= static_cast<std::size_t>(list->values_size())) return false;
    list->mutable_values()->erase(list->mutable_values()->begin() + static_cast<long>(index));
    return true;
  }
  return false;
}

bool Covers(std::string_view prefix, std::string_view path) {
  if (prefix == path) return true;
  if (path.size() <= prefix.size()) return false;
  return path.compare(0, prefix.size(), prefix) == 0 && path[prefix.size()] == '/';
}

std::vector<std::string> OverlappingPaths(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  std::set<std::string> out;
  for (const auto& pa : a) {
    for (const auto& pb : b) {
      if (Covers(pa, pb) || Covers(pb, pa)) {
        out.insert(pa);
        out.insert(pb);
      }
    }
  }
  return {out.begin(), out.end()};
}

bool PointerLess(const std::string& a, const std::string& b) {
  const auto ta = SplitPointer(a);
  const auto tb = SplitPointer(b);
  for (std::size_t i = 0; i < ta.size() && i < tb.size(); ++i) {
    if (ta[i] == tb[i]) continue;
    std::size_t ia = 0;
    std::size_t ib = 0;
    if (ParseIndex(ta[i], &ia) && ParseIndex(tb[i], &ib)) return ia < ib;
    return ta[i] < tb[i];
  }
  return ta.size() < tb.size();
}

} // namespace graphvc::diff
