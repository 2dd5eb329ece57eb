#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/table_name.hpp"

namespace pgshadow::ddl {

enum class StatementKind {
  kAlterTable,
  kCreateTable,      // full redefinition of the source
  kCreatePartition,  // CREATE TABLE ... PARTITION OF <source or earlier partition>
  kCreateIndex,
};

/*
  TargetDdl

  The operator's DDL, parsed with the PostgreSQL grammar (libpg_query) to
  find the one table it changes and to re-aim every statement at the
  shadow instead. Statements are rewritten in place at the positions the
  parse tree reports, so the operator's own formatting is executed.

  Accepted statements:
    ALTER TABLE [IF EXISTS] [ONLY] <source> ...
    CREATE [UNLOGGED] TABLE [IF NOT EXISTS] <source> (...) [PARTITION BY ...]
    CREATE TABLE <partition> PARTITION OF <source | earlier partition> ...
    CREATE [UNIQUE] INDEX [CONCURRENTLY] [[IF NOT EXISTS] name] ON [ONLY] <source> ...

  CONCURRENTLY is dropped: the shadow is not live and the statement runs
  inside a transaction. Column renames (RENAME [COLUMN] a TO b) are
  collected so rows can be mapped across them. Everything else, and DDL
  touching more than one source table, is a util::ValidationError.
*/
class TargetDdl {
 public:
  static TargetDdl Parse(std::string_view ddl, std::string_view default_schema = "public");

  const model::TableName& source() const {
    return source_;
  }

  // CREATE TABLE <source> present: the shadow is built from scratch instead
  // of cloned from the source.
  bool redefines_table() const {
    return redefines_table_;
  }

  // original source column -> final shadow column
  const std::map<std::string, std::string>& column_renames() const {
    return column_renames_;
  }

  std::size_t statement_count() const {
    return statements_.size();
  }

  // Statements with every reference to the source replaced by `shadow`.
  std::vector<std::string> RetargetTo(const model::TableName& shadow) const;

 private:
  struct Edit {
    std::size_t begin;
    std::size_t end;
    // empty replacement with kind kTarget means "the shadow's name"
    enum class Kind { kTarget, kLiteral } kind;
    std::string replacement;
  };

  struct Statement {
    StatementKind     kind;
    std::string       text;
    std::vector<Edit> edits;
  };

  model::TableName                   source_;
  bool                               redefines_table_ = false;
  std::map<std::string, std::string> column_renames_;
  std::vector<Statement>             statements_;
};

} // namespace pgshadow::ddl
