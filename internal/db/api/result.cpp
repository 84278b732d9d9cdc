#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace modstore::db {

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (IsTransient(result.code)) {
    throw util::TransientStoreFailure(message);
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace modstore::db
