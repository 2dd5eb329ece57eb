#include "backfill_sql.hpp"

#include "internal/capture/capture_sql.hpp"

namespace pgshadow::backfill {

namespace {

std::string KeyTuple(const model::PrimaryKey& key, const std::string& alias) {
  std::string out = "(";
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += alias + "." + model::QuoteIdent(key.columns[i].name);
  }
  return out + ")";
}

std::string KeyOrder(const model::PrimaryKey& key, const std::string& alias, const char* direction) {
  std::string out;
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += alias + "." + model::QuoteIdent(key.columns[i].name) + direction;
  }
  return out;
}

} // namespace

std::string KeyFromJson(const model::PrimaryKey& key, int param) {
  std::string out = "(";
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += "($" + std::to_string(param) + "::jsonb ->> " + std::to_string(i) + ")::" + key.columns[i].type;
  }
  return out + ")";
}

std::string KeyToJson(const model::PrimaryKey& key, const std::string& alias) {
  std::string out = "jsonb_build_array(";
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    if (i > 0) out += ", ";
    out += alias + "." + model::QuoteIdent(key.columns[i].name) + "::text";
  }
  return out + ")::text";
}

std::string SnapshotSql(const model::Migration& m) {
  return "SELECT (SELECT COALESCE(max(seq), 0) FROM " + m.log.Qualified() + "), (SELECT " + KeyToJson(m.primary_key, "s") +
         " FROM " + m.source.Qualified() + " s ORDER BY " + KeyOrder(m.primary_key, "s", " DESC") + " LIMIT 1);";
}

std::string CopyChunkSql(const model::Migration& m, bool has_cursor) {
  const auto& key = m.primary_key;

  std::string insert_cols;
  std::string select_exprs;
  for (const auto& mapping : m.column_map.mappings()) {
    if (!insert_cols.empty()) {
      insert_cols += ", ";
      select_exprs += ", ";
    }
    insert_cols += model::QuoteIdent(mapping.shadow);
    select_exprs += "slice." + model::QuoteIdent(mapping.source);
    if (mapping.NeedsCast()) {
      select_exprs += "::" + mapping.shadow_type;
    }
  }

  std::string key_cols;
  for (const auto& c : key.columns) {
    if (!key_cols.empty()) key_cols += ", ";
    key_cols += model::QuoteIdent(c.name);
  }

  const auto  log_keys = capture::LogKeyColumns(key);
  std::string newer_change;
  for (std::size_t i = 0; i < key.columns.size(); ++i) {
    newer_change += " AND l." + log_keys[i] + " = slice." + model::QuoteIdent(key.columns[i].name);
  }

  std::string conflict;
  for (const auto& c : m.conflict_key.columns) {
    if (!conflict.empty()) conflict += ", ";
    conflict += model::QuoteIdent(c.name);
  }

  // the cursor comes from the unlocked key scan; a locked row re-read after
  // a concurrent key change would report its new key in its old position
  std::string sql = "WITH keys AS (\n"
                    "  SELECT " + KeyOrder(key, "s", "") + " FROM " + m.source.Qualified() + " s\n"
                    "  WHERE " + KeyTuple(key, "s") + " <= " + KeyFromJson(key, 1) + "\n";
  if (has_cursor) {
    sql += "    AND " + KeyTuple(key, "s") + " > " + KeyFromJson(key, 4) + "\n";
  }
  sql += "  ORDER BY " + KeyOrder(key, "s", "") + "\n"
         "  LIMIT $3\n"
         "), slice AS (\n"
         "  SELECT s.* FROM " + m.source.Qualified() + " s\n"
         "  WHERE " + KeyTuple(key, "s") + " IN (SELECT " + key_cols + " FROM keys)\n"
         "  FOR SHARE OF s\n"
         "), copied AS (\n"
         "  INSERT INTO " + m.shadow.Qualified() + " (" + insert_cols + ") OVERRIDING SYSTEM VALUE\n"
         "  SELECT " + select_exprs + " FROM slice\n"
         "  WHERE NOT EXISTS (SELECT 1 FROM " + m.log.Qualified() + " l WHERE l.seq > $2" + newer_change + ")\n";
  if (m.KeyWidened()) {
    std::string same_key;
    for (std::size_t i = 0; i < m.shadow_key.columns.size(); ++i) {
      const auto& c = m.shadow_key.columns[i];
      if (i > 0) same_key += " AND ";
      same_key += "t." + model::QuoteIdent(c.name) + " = slice." + model::QuoteIdent(key.columns[i].name) + "::" + c.type;
    }
    sql += "    AND NOT EXISTS (SELECT 1 FROM " + m.shadow.Qualified() + " t WHERE " + same_key + ")\n";
  }
  sql += "  ON CONFLICT (" + conflict + ") DO NOTHING\n"
         "  RETURNING 1\n"
         ")\n"
         "SELECT (SELECT count(*) FROM keys), (SELECT count(*) FROM copied), (SELECT " + KeyToJson(key, "keys") +
         " FROM keys ORDER BY " + KeyOrder(key, "keys", " DESC") + " LIMIT 1);";
  return sql;
}

} // namespace pgshadow::backfill
