#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace pgshadow::model {

// Stored in the log table's `op` column as a single character.
enum class ChangeOp : char {
  kInsert   = 'I',
  kUpdate   = 'U',
  kDelete   = 'D',
  kTruncate = 'T',
};

constexpr std::optional<ChangeOp> ParseChangeOp(char c) {
  switch (c) {
    case 'I':
      return ChangeOp::kInsert;
    case 'U':
      return ChangeOp::kUpdate;
    case 'D':
      return ChangeOp::kDelete;
    case 'T':
      return ChangeOp::kTruncate;
    default:
      return std::nullopt;
  }
}

/*
  One captured mutation, as read back from the log table.

  `key` is the primary key rendered by the server as a JSON array of the key
  columns' text forms (e.g. ["42"]). It is empty for truncate records.
  `row_image` is to_jsonb(NEW) for insert/update, absent otherwise.
*/
struct ChangeRecord {
  int64_t                    seq = 0;
  ChangeOp                   op  = ChangeOp::kInsert;
  std::string                key;
  std::optional<std::string> row_image;
};

} // namespace pgshadow::model
