#include "target_ddl.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "parse_tree.hpp"

namespace pgshadow::ddl {

namespace {

using google::protobuf::Struct;

struct RelationRef {
  std::size_t      begin     = 0;  // offsets into the statement text
  std::size_t      end       = 0;
  bool             qualified = false;
  model::TableName name;
};

[[noreturn]] void Fail(const std::string& text, const std::string& what) {
  throw util::ValidationError("target DDL: " + what + " in: " + text);
}

// Reads a RangeVar node of the statement parsed from ddl[stmt.begin, stmt.end).
RelationRef ReadRelation(std::string_view ddl, const ParsedStatement& stmt, const std::string& text, const Struct* range_var,
                         std::string_view default_schema) {
  if (range_var == nullptr) {
    Fail(text, "expected a table name");
  }
  if (!Text(*range_var, "catalogname").empty()) {
    Fail(text, "database-qualified names are not supported");
  }

  const auto location = Number(*range_var, "location", -1);
  if (location < static_cast<int64_t>(stmt.begin) || location >= static_cast<int64_t>(stmt.end)) {
    Fail(text, "table name has no position in the statement");
  }

  RelationRef ref;
  ref.qualified     = !Text(*range_var, "schemaname").empty();
  ref.name.schema   = ref.qualified ? Text(*range_var, "schemaname") : std::string(default_schema);
  ref.name.name     = Text(*range_var, "relname");
  const auto offset = static_cast<std::size_t>(location);
  ref.begin         = offset - stmt.begin;
  ref.end           = NameEnd(ddl, offset, ref.qualified ? 2 : 1) - stmt.begin;
  return ref;
}

} // namespace

TargetDdl TargetDdl::Parse(std::string_view ddl, std::string_view default_schema) {
  TargetDdl                     out;
  bool                          have_source = false;
  std::vector<model::TableName> partitions;

  auto bind = [&](const std::string& text, const RelationRef& rel) {
    if (!have_source) {
      out.source_ = rel.name;
      have_source = true;
      return;
    }
    if (rel.name != out.source_) {
      Fail(text, "only one table can be migrated per run (" + out.source_.Display() + " and " + rel.name.Display() + ")");
    }
  };

  auto record_rename = [&](const std::string& from, const std::string& to) {
    for (auto& [original, current] : out.column_renames_) {
      if (current == from) {
        current = to;
        return;
      }
    }
    out.column_renames_[from] = to;
  };

  for (const auto& parsed : ParseStatements(ddl)) {
    Statement stmt;
    stmt.text = std::string(ddl.substr(parsed.begin, parsed.end - parsed.begin));

    const auto& text     = stmt.text;
    const auto& node     = parsed.node;
    auto        relation = [&](const Struct* range_var) {
      return ReadRelation(ddl, parsed, text, range_var, default_schema);
    };

    if (parsed.type == "AlterTableStmt") {
      // "relkind" before PostgreSQL 15, "objtype" after
      const auto objtype = Text(node, "objtype").empty() ? Text(node, "relkind") : Text(node, "objtype");
      if (objtype != "OBJECT_TABLE") {
        Fail(text, "only ALTER TABLE is supported");
      }
      const auto rel = relation(Child(node, "relation"));
      bind(text, rel);
      stmt.kind = StatementKind::kAlterTable;
      stmt.edits.push_back(Edit{rel.begin, rel.end, Edit::Kind::kTarget, {}});
    } else if (parsed.type == "RenameStmt") {
      const auto rename = Text(node, "renameType");
      if (rename == "OBJECT_TABLE") {
        Fail(text, "renaming the table itself is not supported");
      }
      if (rename == "OBJECT_COLUMN") {
        if (Text(node, "relationType") != "OBJECT_TABLE") {
          Fail(text, "only ALTER TABLE is supported");
        }
        record_rename(Text(node, "subname"), Text(node, "newname"));
      } else if (rename != "OBJECT_TABCONSTRAINT") {
        Fail(text, "unsupported rename");
      }
      const auto rel = relation(Child(node, "relation"));
      bind(text, rel);
      stmt.kind = StatementKind::kAlterTable;
      stmt.edits.push_back(Edit{rel.begin, rel.end, Edit::Kind::kTarget, {}});
    } else if (parsed.type == "IndexStmt") {
      const auto rel = relation(Child(node, "relation"));
      bind(text, rel);
      stmt.kind = StatementKind::kCreateIndex;
      stmt.edits.push_back(Edit{rel.begin, rel.end, Edit::Kind::kTarget, {}});

      if (Flag(node, "concurrent")) {
        const auto conc = FindKeyword(text, 0, rel.begin, "CONCURRENTLY");
        if (conc == std::string::npos) {
          Fail(text, "cannot locate CONCURRENTLY");
        }
        auto next = conc + 12;
        while (next < text.size() && (text[next] == ' ' || text[next] == '\t' || text[next] == '\n')) ++next;
        stmt.edits.push_back(Edit{conc, next, Edit::Kind::kLiteral, {}});
      }
    } else if (parsed.type == "CreateStmt") {
      const Struct* range_var = Child(node, "relation");
      if (range_var != nullptr && Text(*range_var, "relpersistence") == "t") {
        Fail(text, "temporary tables cannot replace a live table");
      }
      const auto rel = relation(range_var);

      if (Child(node, "partbound") != nullptr) {
        const auto* parents = Items(node, "inhRelations");
        if (parents == nullptr || parents->values_size() != 1) {
          Fail(text, "a partition needs exactly one parent");
        }
        const auto parent = relation(Unwrap(parents->values(0), "RangeVar"));
        const bool nested = std::find(partitions.begin(), partitions.end(), parent.name) != partitions.end();
        if (!nested) {
          bind(text, parent);
          stmt.edits.push_back(Edit{parent.begin, parent.end, Edit::Kind::kTarget, {}});
        }

        // partitions live beside the table they will end up under
        model::TableName part = rel.name;
        if (!rel.qualified) {
          part.schema = out.source_.schema;
          stmt.edits.push_back(Edit{rel.begin, rel.end, Edit::Kind::kLiteral, part.Qualified()});
        }
        if (part == out.source_) {
          Fail(text, "a partition cannot take the source table's name");
        }
        partitions.push_back(part);
        stmt.kind = StatementKind::kCreatePartition;
      } else {
        if (Child(node, "ofTypename") != nullptr) {
          Fail(text, "CREATE TABLE must define columns");
        }
        if (Items(node, "inhRelations") != nullptr) {
          Fail(text, "table inheritance is not supported");
        }
        bind(text, rel);
        if (!out.statements_.empty()) {
          Fail(text, "CREATE TABLE of the migrated table must be the first statement");
        }
        out.redefines_table_ = true;
        stmt.kind            = StatementKind::kCreateTable;
        stmt.edits.push_back(Edit{rel.begin, rel.end, Edit::Kind::kTarget, {}});
      }
    } else {
      Fail(text, "unsupported statement (" + parsed.type + ")");
    }

    out.statements_.push_back(std::move(stmt));
  }

  if (out.statements_.empty()) {
    throw util::ValidationError("target DDL contains no statements");
  }

  if (!out.redefines_table_) {
    for (const auto& stmt : out.statements_) {
      if (stmt.kind == StatementKind::kCreatePartition) {
        throw util::ValidationError("target DDL: partitions of " + out.source_.Display() +
                                    " require a CREATE TABLE ... PARTITION BY redefinition first");
      }
    }
  }

  return out;
}

std::vector<std::string> TargetDdl::RetargetTo(const model::TableName& shadow) const {
  std::vector<std::string> out;
  out.reserve(statements_.size());

  const std::string target = shadow.Qualified();
  for (const auto& stmt : statements_) {
    auto edits = stmt.edits;
    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.begin > b.begin; });

    std::string text = stmt.text;
    for (const auto& e : edits) {
      text.replace(e.begin, e.end - e.begin, e.kind == Edit::Kind::kTarget ? target : e.replacement);
    }
    out.push_back(std::move(text));
  }
  return out;
}

} // namespace pgshadow::ddl
