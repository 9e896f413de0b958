#pragma once

#include <string>
#include <utility>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace warden::db {

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
      throw warden::util::ConflictError(message);
    case ErrorCode::NotFound:
      throw warden::util::NotFoundError(message);
    default:
      throw warden::util::StorageError(message);
  }
}

/*
  Runs fn, turning backend exceptions (Begin/Commit/read failures) into
  StorageError. Domain errors thrown by fn pass through untouched.
*/
template <typename Fn>
auto Guarded(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const DbError& e) {
    if (e.code() == ErrorCode::Conflict) {
      throw warden::util::ConflictError(context + ": " + e.what());
    }
    throw warden::util::StorageError(context + ": " + e.what());
  }
}

} // namespace warden::db
