#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace pgshadow::model {

// PostgreSQL truncates identifiers to NAMEDATALEN - 1 bytes.
inline constexpr std::size_t kMaxIdentifierLength = 63;

// Double-quotes an identifier, doubling embedded quotes.
std::string QuoteIdent(std::string_view ident);

// Single-quotes a string literal, doubling embedded quotes.
std::string QuoteLiteral(std::string_view value);

/*
  Schema-qualified relation name.

  Names are stored exactly as they appear in pg_class / pg_namespace (case
  preserved, unquoted). Qualified() renders them quoted for SQL text.
*/
struct TableName {
  std::string schema;
  std::string name;

  // "schema"."name"
  std::string Qualified() const;

  // schema.name, unquoted, for logs and registry keys
  std::string Display() const;

  bool operator==(const TableName& other) const {
    return schema == other.schema && name == other.name;
  }
  bool operator!=(const TableName& other) const {
    return !(*this == other);
  }
};

/*
  Parses `name`, `schema.name`, and quoted forms like `"My Schema"."T"`.
  Unquoted parts are folded to lower case the way the server folds them.
  A missing schema is filled with `default_schema`.
  Returns nullopt on malformed input.
*/
std::optional<TableName> ParseTableName(std::string_view text, std::string_view default_schema = "public");

} // namespace pgshadow::model
