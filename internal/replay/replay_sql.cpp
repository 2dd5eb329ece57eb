#include "replay_sql.hpp"

#include "internal/capture/capture_sql.hpp"

namespace pgshadow::replay {

std::string TakeBatchSql(const model::Migration& m) {
  const auto  log_keys = capture::LogKeyColumns(m.primary_key);
  std::string key_json = "jsonb_build_array(";
  for (std::size_t i = 0; i < log_keys.size(); ++i) {
    if (i > 0) key_json += ", ";
    key_json += log_keys[i] + "::text";
  }
  key_json += ")::text";

  const auto log = m.log.Qualified();
  return "DELETE FROM " + log + " WHERE seq IN (SELECT seq FROM " + log + " ORDER BY seq LIMIT $1) RETURNING seq, op, " +
         key_json + ", row_image::text;";
}

std::string ClearShadowSql(const model::Migration& m) {
  return "DELETE FROM " + m.shadow.Qualified() + ";";
}

std::string DeleteKeysSql(const model::Migration& m) {
  std::string lhs = "(";
  std::string rhs = "(";
  for (std::size_t i = 0; i < m.shadow_key.columns.size(); ++i) {
    const auto& c = m.shadow_key.columns[i];
    if (i > 0) {
      lhs += ", ";
      rhs += ", ";
    }
    lhs += "t." + model::QuoteIdent(c.name);
    rhs += "(k.key ->> " + std::to_string(i) + ")::" + c.type;
  }
  return "DELETE FROM " + m.shadow.Qualified() + " t USING jsonb_array_elements($1::jsonb) AS k(key) WHERE " + lhs +
         ") = " + rhs + ");";
}

std::string DeleteImageKeysSql(const model::Migration& m) {
  std::string lhs = "(";
  std::string rhs = "(";
  for (std::size_t i = 0; i < m.shadow_key.columns.size(); ++i) {
    const auto& c = m.shadow_key.columns[i];
    if (i > 0) {
      lhs += ", ";
      rhs += ", ";
    }
    lhs += "t." + model::QuoteIdent(c.name);
    rhs += "r." + model::QuoteIdent(m.primary_key.columns[i].name) + "::" + c.type;
  }
  return "DELETE FROM " + m.shadow.Qualified() + " t USING jsonb_populate_recordset(NULL::" + m.source.Qualified() +
         ", $1::jsonb) r WHERE " + lhs + ") = " + rhs + ");";
}

std::string UpsertImagesSql(const model::Migration& m) {
  std::string cols;
  std::string exprs;
  for (const auto& mapping : m.column_map.mappings()) {
    if (!cols.empty()) {
      cols += ", ";
      exprs += ", ";
    }
    cols += model::QuoteIdent(mapping.shadow);
    exprs += "r." + model::QuoteIdent(mapping.source);
    if (mapping.NeedsCast()) {
      exprs += "::" + mapping.shadow_type;
    }
  }

  std::string conflict;
  for (const auto& c : m.conflict_key.columns) {
    if (!conflict.empty()) conflict += ", ";
    conflict += model::QuoteIdent(c.name);
  }

  std::string action = "DO NOTHING";
  if (!m.column_map.updatable().empty()) {
    action = "DO UPDATE SET ";
    bool first = true;
    for (const auto& col : m.column_map.updatable()) {
      if (!first) action += ", ";
      first = false;
      action += model::QuoteIdent(col) + " = EXCLUDED." + model::QuoteIdent(col);
    }
  }

  return "INSERT INTO " + m.shadow.Qualified() + " (" + cols + ") OVERRIDING SYSTEM VALUE SELECT " + exprs +
         " FROM jsonb_populate_recordset(NULL::" + m.source.Qualified() + ", $1::jsonb) r ON CONFLICT (" + conflict + ") " +
         action + ";";
}

std::string BacklogSql(const model::Migration& m) {
  return "SELECT count(*) FROM " + m.log.Qualified() + ";";
}

} // namespace pgshadow::replay
