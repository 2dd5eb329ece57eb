#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pgshadow::ddl {

/*
  One raw statement of a libpg_query parse tree.

  `type` is the node name ("AlterTableStmt", "CreateStmt", ...) and `node`
  its fields. [begin, end) is the statement's text in the parsed input with
  surrounding whitespace and the terminating semicolon left out.
*/
struct ParsedStatement {
  std::string              type;
  google::protobuf::Struct node;
  std::size_t              begin = 0;
  std::size_t              end   = 0;
};

// Parses `sql` with the PostgreSQL grammar. A syntax error is a
// util::ValidationError naming the position.
std::vector<ParsedStatement> ParseStatements(std::string_view sql);

// Field access over parse nodes; a missing field reads as empty/false/null.
const google::protobuf::Struct*    Child(const google::protobuf::Struct& node, const std::string& field);
const google::protobuf::ListValue* Items(const google::protobuf::Struct& node, const std::string& field);
std::string                        Text(const google::protobuf::Struct& node, const std::string& field);
bool                               Flag(const google::protobuf::Struct& node, const std::string& field);
int64_t                            Number(const google::protobuf::Struct& node, const std::string& field, int64_t fallback);

// List elements are wrapped in their node type: {"RangeVar": {...}}.
const google::protobuf::Struct* Unwrap(const google::protobuf::Value& item, const std::string& type);

// End offset of a name of `parts` dot-separated identifiers starting at
// `begin`. Parse nodes only carry where a name starts.
std::size_t NameEnd(std::string_view sql, std::size_t begin, int parts);

// Offset of `keyword` as a whole word in [from, to), outside quoted names
// and comments, or npos.
std::size_t FindKeyword(std::string_view sql, std::size_t from, std::size_t to, std::string_view keyword);

} // namespace pgshadow::ddl
