#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace graphvc::util {

// Translate a failed repository result into the core exception types.
inline void ThrowIfDbError(const graphvc::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + graphvc::db::ErrorCodeName(result.code) + "]";
  if (!result.message.empty()) message += ": " + result.message;
  switch (result.code) {
    case graphvc::db::ErrorCode::NotFound:
      throw NotFound(message);
    case graphvc::db::ErrorCode::AlreadyExists:
    case graphvc::db::ErrorCode::Conflict:
    case graphvc::db::ErrorCode::ConstraintViolation:
    case graphvc::db::ErrorCode::SerializationFailure:
      throw Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace graphvc::util
