#pragma once

#include <stdexcept>
#include <string>

namespace graphvc::util {

/*
  Central error types.

  Merge conflicts are not errors: they are reported in-band
  as MERGE_STATUS_CONFLICT entries of a MergeSummary.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Duplicate key, stale head, or object already in the requested state.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Short class name for logs, spans and CLI output.
inline const char* ErrorKind(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const Conflict*>(&e)) return "conflict";
  if (dynamic_cast<const ValidationError*>(&e)) return "validation";
  return "internal";
}

} // namespace graphvc::util
