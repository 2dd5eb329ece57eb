#include "registry_sql.hpp"

#include "internal/model/naming.hpp"

namespace pgshadow::registry {

namespace {

std::string Table(std::string_view work_schema) {
  return model::RegistryTable(work_schema).Qualified();
}

} // namespace

std::string CreateRegistrySql(std::string_view work_schema) {
  return "CREATE SCHEMA IF NOT EXISTS " + model::QuoteIdent(work_schema) + ";\n"
         "CREATE TABLE IF NOT EXISTS " + Table(work_schema) + " (\n"
         "  source_schema    text        NOT NULL,\n"
         "  source_name      text        NOT NULL,\n"
         "  shadow_name      text        NOT NULL,\n"
         "  log_name         text        NOT NULL,\n"
         "  target_ddl       text        NOT NULL,\n"
         "  phase            text        NOT NULL,\n"
         "  mode             text        NOT NULL,\n"
         "  started_at       timestamptz NOT NULL DEFAULT now(),\n"
         "  updated_at       timestamptz NOT NULL DEFAULT now(),\n"
         "  snapshot_seq     bigint,\n"
         "  snapshot_max_key jsonb,\n"
         "  backfill_cursor  jsonb,\n"
         "  backfill_done    boolean     NOT NULL DEFAULT false,\n"
         "  replay_watermark bigint      NOT NULL DEFAULT 0,\n"
         "  rows_copied      bigint      NOT NULL DEFAULT 0,\n"
         "  changes_applied  bigint      NOT NULL DEFAULT 0,\n"
         "  PRIMARY KEY (source_schema, source_name)\n"
         ");";
}

std::string UpdatePhaseSql(std::string_view work_schema) {
  return "UPDATE " + Table(work_schema) +
         " SET phase = $3, updated_at = now() WHERE source_schema = $1 AND source_name = $2;";
}

std::string BackfillProgressSql(std::string_view work_schema) {
  return "UPDATE " + Table(work_schema) +
         " SET backfill_cursor = COALESCE($3::jsonb, backfill_cursor),"
         " rows_copied = rows_copied + $4,"
         " backfill_done = $5,"
         " updated_at = now()"
         " WHERE source_schema = $1 AND source_name = $2;";
}

std::string ReplayProgressSql(std::string_view work_schema) {
  return "UPDATE " + Table(work_schema) +
         " SET replay_watermark = GREATEST(replay_watermark, $3),"
         " changes_applied = changes_applied + $4,"
         " updated_at = now()"
         " WHERE source_schema = $1 AND source_name = $2;";
}

} // namespace pgshadow::registry
