#include "pg_errors.hpp"

#include <pqxx/pqxx>

namespace pgshadow::db::postgres {

ErrorCode ClassifySqlState(std::string_view sqlstate) {
  if (sqlstate.size() != 5) {
    return ErrorCode::InternalError;
  }

  if (sqlstate == "40001") return ErrorCode::SerializationFailure;
  if (sqlstate == "40P01") return ErrorCode::Deadlock;
  if (sqlstate == "55P03") return ErrorCode::LockTimeout;
  // statement_timeout / lock_timeout surfaced as query_canceled
  if (sqlstate == "57014") return ErrorCode::LockTimeout;
  if (sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03") return ErrorCode::ConnectionLost;
  if (sqlstate == "53300") return ErrorCode::Busy;
  if (sqlstate == "42501") return ErrorCode::PermissionDenied;
  if (sqlstate == "42P01" || sqlstate == "42883" || sqlstate == "3F000") return ErrorCode::NotFound;
  if (sqlstate == "42P07" || sqlstate == "42710" || sqlstate == "42P06") return ErrorCode::AlreadyExists;
  if (sqlstate == "23505") return ErrorCode::Conflict;

  const auto cls = sqlstate.substr(0, 2);
  if (cls == "08") return ErrorCode::ConnectionLost;
  if (cls == "23") return ErrorCode::ConstraintViolation;
  if (cls == "22" || cls == "42") return ErrorCode::InvalidInput;

  return ErrorCode::InternalError;
}

Result Translate(const std::exception& e) {
  if (const auto* db_error = dynamic_cast<const DbError*>(&e)) {
    return Result::Err(db_error->code(), db_error->what());
  }
  // commit outcome unknown; callers only retry idempotent units
  if (dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::ConnectionLost, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::ConnectionLost, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    return Result::Err(ClassifySqlState(sql->sqlstate()), e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

} // namespace pgshadow::db::postgres
