#include "pg_shadow_table_manager.hpp"

#include "internal/db/postgres/pg_catalog.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgshadow::shadow {

using db::postgres::PgCatalog;
using db::postgres::PgTransaction;

PgShadowTableManager::PgShadowTableManager(std::shared_ptr<db::postgres::PgPool> pool, std::chrono::milliseconds lock_timeout)
    : pool_(std::move(pool)), lock_timeout_(lock_timeout) {
}

ShadowLayout PgShadowTableManager::Create(const ShadowSpec& spec, const catalog::TableInfo& source) {
  PgTransaction tx(pool_);
  tx.SetLockTimeout(lock_timeout_);
  auto& w = tx.Work();

  if (!spec.redefines_table) {
    w.exec("CREATE TABLE " + spec.shadow.Qualified() + " (LIKE " + spec.source.Qualified() + " INCLUDING ALL);");
  }
  for (const auto& stmt : spec.statements) {
    PGSHADOW_LOG_DEBUG("applying target DDL to shadow", {observability::StringField("sql", stmt)});
    w.exec(stmt);
  }

  auto shadow = PgCatalog::DescribeTable(w, spec.shadow);
  if (!shadow) {
    throw util::ValidationError("target DDL did not produce " + spec.shadow.Display());
  }

  // throws before commit, so an invalid shadow rolls back with the DDL
  auto layout = BuildShadowLayout(source, *shadow, spec.column_renames);
  tx.Commit();

  for (const auto& col : layout.column_map.dropped()) {
    PGSHADOW_LOG_WARN("source column has no counterpart in the shadow and will be dropped",
                      {observability::TableField("table", spec.source), observability::StringField("column", col)});
  }
  PGSHADOW_LOG_INFO("shadow table created",
                    {observability::TableField("shadow", spec.shadow),
                     observability::IntField("mapped_columns", static_cast<int64_t>(layout.column_map.mappings().size())),
                     observability::IntField("added_columns", static_cast<int64_t>(layout.column_map.added().size()))});
  return layout;
}

ShadowLayout PgShadowTableManager::Load(const ShadowSpec& spec, const catalog::TableInfo& source) {
  PgTransaction tx(pool_);
  auto          shadow = PgCatalog::DescribeTable(tx.Work(), spec.shadow);
  tx.Commit();

  if (!shadow) {
    throw util::ValidationError("shadow " + spec.shadow.Display() + " recorded in the registry is missing");
  }
  return BuildShadowLayout(source, *shadow, spec.column_renames);
}

bool PgShadowTableManager::Exists(const model::TableName& shadow) {
  PgTransaction tx(pool_);
  const bool    exists = PgCatalog::RelationExists(tx.Work(), shadow);
  tx.Commit();
  return exists;
}

void PgShadowTableManager::Drop(const model::TableName& shadow) {
  PgTransaction tx(pool_);
  tx.SetLockTimeout(lock_timeout_);
  tx.Work().exec("DROP TABLE IF EXISTS " + shadow.Qualified() + ";");
  tx.Commit();
  PGSHADOW_LOG_INFO("shadow table dropped", {observability::TableField("shadow", shadow)});
}

} // namespace pgshadow::shadow
