#include "capture_sql.hpp"

#include <string_view>

namespace pgshadow::capture {

namespace {

std::string Function(const model::ArtifactNames& names, const std::string& fn) {
  return model::QuoteIdent(names.log.schema) + "." + model::QuoteIdent(fn);
}

std::string Join(const std::vector<std::string>& parts, const std::string& prefix = {}) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += ", ";
    out += prefix + parts[i];
  }
  return out;
}

std::vector<std::string> QuotedKeyNames(const model::PrimaryKey& key) {
  std::vector<std::string> out;
  for (const auto& c : key.columns) out.push_back(model::QuoteIdent(c.name));
  return out;
}

std::string LogInsert(const std::string& log, const std::string& op, const std::vector<std::string>& key_cols,
                      const std::vector<std::string>& values, const std::string& image) {
  return "INSERT INTO " + log + " (op, " + Join(key_cols) + ", row_image) VALUES ('" + op + "', " + Join(values) + ", " +
         image + ");";
}

} // namespace

std::vector<std::string> LogKeyColumns(const model::PrimaryKey& key) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    out.push_back("k" + std::to_string(i + 1));
  }
  return out;
}

std::string CreateLogTableSql(const model::ArtifactNames& names, const model::PrimaryKey& key) {
  const auto log     = names.log.Qualified();
  const auto key_cols = LogKeyColumns(key);

  std::string sql = "CREATE TABLE IF NOT EXISTS " + log + " (\n  seq bigserial PRIMARY KEY,\n"
                    "  op char(1) NOT NULL CHECK (op IN ('I', 'U', 'D', 'T')),\n";
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    sql += "  " + key_cols[i] + " " + key.columns[i].type + ",\n";
  }
  sql += "  row_image jsonb,\n  captured_at timestamptz NOT NULL DEFAULT clock_timestamp()\n);\n";
  sql += "CREATE INDEX IF NOT EXISTS " + model::QuoteIdent(names.log_key_index) + " ON " + log + " (" + Join(key_cols) +
         ", seq);";
  return sql;
}

std::string CreateRowFunctionSql(const model::ArtifactNames& names, const model::PrimaryKey& key) {
  const auto log      = names.log.Qualified();
  const auto key_cols = LogKeyColumns(key);
  const auto quoted   = QuotedKeyNames(key);

  std::vector<std::string> old_key;
  std::vector<std::string> new_key;
  for (const auto& q : quoted) {
    old_key.push_back("OLD." + q);
    new_key.push_back("NEW." + q);
  }

  // SECURITY DEFINER: writers of the source need no rights on the work schema
  return "CREATE OR REPLACE FUNCTION " + Function(names, names.row_function) +
         "() RETURNS trigger LANGUAGE plpgsql SECURITY DEFINER SET search_path = pg_catalog, pg_temp AS $pgshadow$\n"
         "BEGIN\n"
         "  IF TG_OP = 'INSERT' THEN\n"
         "    " + LogInsert(log, "I", key_cols, new_key, "to_jsonb(NEW)") + "\n"
         "  ELSIF TG_OP = 'UPDATE' THEN\n"
         "    IF ROW(" + Join(old_key) + ") IS DISTINCT FROM ROW(" + Join(new_key) + ") THEN\n"
         "      " + LogInsert(log, "D", key_cols, old_key, "NULL") + "\n"
         "    END IF;\n"
         "    " + LogInsert(log, "U", key_cols, new_key, "to_jsonb(NEW)") + "\n"
         "  ELSE\n"
         "    " + LogInsert(log, "D", key_cols, old_key, "NULL") + "\n"
         "  END IF;\n"
         "  RETURN NULL;\n"
         "END;\n"
         "$pgshadow$;";
}

std::string CreateTruncateFunctionSql(const model::ArtifactNames& names) {
  return "CREATE OR REPLACE FUNCTION " + Function(names, names.truncate_function) +
         "() RETURNS trigger LANGUAGE plpgsql SECURITY DEFINER SET search_path = pg_catalog, pg_temp AS $pgshadow$\n"
         "BEGIN\n"
         "  INSERT INTO " + names.log.Qualified() + " (op) VALUES ('T');\n"
         "  RETURN NULL;\n"
         "END;\n"
         "$pgshadow$;";
}

std::string CreateTriggersSql(const model::TableName& source, const model::ArtifactNames& names) {
  const auto rel   = source.Qualified();
  const auto row   = Function(names, names.row_function);
  const auto trunc = Function(names, names.truncate_function);

  auto trigger = [&](std::string_view name, const std::string& event, const std::string& level, const std::string& fn) {
    const auto quoted = model::QuoteIdent(name);
    return "DROP TRIGGER IF EXISTS " + quoted + " ON " + rel + ";\n" + "CREATE TRIGGER " + quoted + " AFTER " + event +
           " ON " + rel + " FOR EACH " + level + " EXECUTE FUNCTION " + fn + "();\n";
  };

  return trigger(model::kInsertTrigger, "INSERT", "ROW", row) + trigger(model::kUpdateTrigger, "UPDATE", "ROW", row) +
         trigger(model::kDeleteTrigger, "DELETE", "ROW", row) +
         trigger(model::kTruncateTrigger, "TRUNCATE", "STATEMENT", trunc);
}

std::string DropTriggersSql(const model::TableName& table) {
  const auto  rel = table.Qualified();
  std::string sql;
  for (auto name : {model::kInsertTrigger, model::kUpdateTrigger, model::kDeleteTrigger, model::kTruncateTrigger}) {
    sql += "DROP TRIGGER IF EXISTS " + model::QuoteIdent(name) + " ON " + rel + ";\n";
  }
  return sql;
}

std::string DropFunctionsSql(const model::ArtifactNames& names) {
  // CASCADE takes any remaining capture triggers with it, wherever their
  // table was moved
  return "DROP FUNCTION IF EXISTS " + Function(names, names.row_function) + "() CASCADE;\n" + "DROP FUNCTION IF EXISTS " +
         Function(names, names.truncate_function) + "() CASCADE;";
}

std::string DropLogSql(const model::ArtifactNames& names) {
  return "DROP TABLE IF EXISTS " + names.log.Qualified() + ";";
}

} // namespace pgshadow::capture
