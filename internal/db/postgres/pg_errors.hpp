#pragma once

#include <exception>
#include <string_view>

#include "internal/db/api/result.hpp"

namespace pgshadow::db::postgres {

// Maps a SQLSTATE (five characters) to a portable code.
ErrorCode ClassifySqlState(std::string_view sqlstate);

// Translates libpqxx exceptions (and DbError) into a Result.
Result Translate(const std::exception& e);

inline bool IsTransient(const std::exception& e) {
  return db::IsTransient(Translate(e).code);
}

} // namespace pgshadow::db::postgres
