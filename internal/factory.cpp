#include "factory.hpp"

#include <memory>

#include "internal/backfill/pg_chunk_copier.hpp"
#include "internal/capture/trigger_capture_installer.hpp"
#include "internal/cutover/pg_swap_coordinator.hpp"
#include "internal/db/postgres/pg_catalog.hpp"
#include "internal/db/postgres/pg_migration_registry.hpp"
#include "internal/db/retry_policy.hpp"
#include "internal/replay/pg_change_applier.hpp"
#include "internal/shadow/pg_shadow_table_manager.hpp"
#include "internal/util/errors.hpp"

namespace pgshadow::factory {

core::Components BuildComponents(std::shared_ptr<db::postgres::PgPool> pool, const config::Settings& settings) {
  const auto& work    = settings.migration.work_schema;
  const auto  timeout = settings.cutover.lock_timeout;

  core::Components c;
  c.inspector = std::make_shared<db::postgres::PgCatalog>(pool);
  c.registry  = std::make_shared<db::postgres::PgMigrationRegistry>(pool, work);
  c.locker    = std::make_shared<db::postgres::PgTableLocker>(pool);
  c.capture   = std::make_shared<capture::TriggerCaptureInstaller>(pool, db::RetryPolicy(settings.retry), timeout);
  c.shadows   = std::make_shared<shadow::PgShadowTableManager>(pool, timeout);
  c.copier    = std::make_shared<backfill::PgChunkCopier>(pool, work);
  c.applier   = std::make_shared<replay::PgChangeApplier>(pool, work);

  cutover::SwapOptions swap;
  swap.work_schema      = work;
  swap.archive_schema   = settings.migration.archive_schema;
  swap.lock_timeout     = timeout;
  swap.drain_batch_size = settings.replay.batch_size;
  c.swapper             = std::make_shared<cutover::PgSwapCoordinator>(pool, swap);

  return c;
}

/*
    Build full application dependency graph
*/
Application Build(const config::Settings& settings) {
  if (settings.database.connection_uri.empty()) {
    throw util::ConfigError("no database connection: pass --uri or set database.connection_uri");
  }

  Application app;
  app.pool = std::make_shared<db::postgres::PgPool>(settings.database.connection_uri, settings.database.max_connections,
                                                    settings.database.application_name);
  app.orchestrator = std::make_unique<core::MigrationOrchestrator>(BuildComponents(app.pool, settings), settings);
  return app;
}

} // namespace pgshadow::factory
