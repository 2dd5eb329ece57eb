#pragma once

#include <memory>

#include "internal/config/settings.hpp"
#include "internal/core/migration_orchestrator.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace pgshadow::factory {

/*
  Application

  Owns the connection pool and the orchestrator for one invocation.
*/
struct Application {
  std::shared_ptr<db::postgres::PgPool>        pool;
  std::unique_ptr<core::MigrationOrchestrator> orchestrator;
};

/*
  BuildComponents

  Wires every PostgreSQL-backed component onto one pool.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
core::Components BuildComponents(std::shared_ptr<db::postgres::PgPool> pool, const config::Settings& settings);

Application Build(const config::Settings& settings);

} // namespace pgshadow::factory
