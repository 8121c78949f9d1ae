#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace graphvc::diff {

/*
  RFC 6901 JSON Pointer helpers over google::protobuf::Value trees.

  "" addresses the root, "/a/0/b~1c" addresses key "b/c" inside the
  first element of array "a".
*/

std::string              EscapeToken(std::string_view token);
std::string              UnescapeToken(std::string_view token);
std::vector<std::string> SplitPointer(std::string_view pointer);

// nullptr when the path does not exist
const google::protobuf::Value* Lookup(const google::protobuf::Value& root, std::string_view pointer);

// Creates intermediate objects; array indices may address an existing
// element or append at size(), gaps are padded with null.
// Returns false when a non-container is in the way.
bool Set(google::protobuf::Value* root, std::string_view pointer, const google::protobuf::Value& value);

// Returns false when the path does not exist.
bool Remove(google::protobuf::Value* root, std::string_view pointer);

// True if `prefix` equals `path` or is an ancestor of it at a segment boundary.
bool Covers(std::string_view prefix, std::string_view path);

// Paths of either set that equal or cover a path of the other, sorted.
// Two path sets overlap when this is non-empty.
std::vector<std::string> OverlappingPaths(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Document order: segment by segment, numeric segments compared as numbers.
bool PointerLess(const std::string& a, const std::string& b);

} // namespace graphvc::diff
