#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace relations::core {

// Rethrows a failed repository result. NotFound keeps its meaning, every
// other code is an internal error.
inline void ThrowIfDbError(const relations::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + std::string(relations::db::ToString(result.code)) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case relations::db::ErrorCode::NotFound:
      throw relations::util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace relations::core
