#include "pg_migration_registry.hpp"

#include "internal/model/naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/registry_sql.hpp"
#include "internal/util/errors.hpp"
#include "pg_catalog.hpp"
#include "pg_tx.hpp"

namespace pgshadow::db::postgres {

namespace {

// 'pgsh'; first half of every advisory lock key this tool takes
constexpr int kAdvisoryLockClass = 0x70677368;

constexpr const char* kSelectColumns =
    "source_schema, source_name, shadow_name, log_name, target_ddl, phase, mode, "
    "(extract(epoch FROM started_at) * 1000)::bigint, (extract(epoch FROM updated_at) * 1000)::bigint, "
    "snapshot_seq, snapshot_max_key::text, backfill_cursor::text, backfill_done, replay_watermark, "
    "rows_copied, changes_applied";

model::MigrationRecord FromRow(const pqxx::row& row, const std::string& work_schema) {
  model::MigrationRecord r;
  r.source     = model::TableName{row[0].as<std::string>(), row[1].as<std::string>()};
  r.shadow     = model::TableName{work_schema, row[2].as<std::string>()};
  r.log        = model::TableName{work_schema, row[3].as<std::string>()};
  r.target_ddl = row[4].as<std::string>();

  const auto phase_text = row[5].as<std::string>();
  const auto phase      = model::ParsePhase(phase_text);
  if (!phase) {
    throw util::ConfigError("registry row for " + r.source.Display() + " has unknown phase '" + phase_text + "'");
  }
  r.phase      = *phase;
  const auto mode_text = row[6].as<std::string>();
  const auto mode      = model::ParseRunMode(mode_text);
  if (!mode) {
    throw util::ConfigError("registry row for " + r.source.Display() + " has unknown mode '" + mode_text + "'");
  }
  r.mode       = *mode;
  r.started_at = util::FromUnixMillis(row[7].as<uint64_t>());
  r.updated_at = util::FromUnixMillis(row[8].as<uint64_t>());

  if (!row[9].is_null()) {
    r.snapshot.taken   = true;
    r.snapshot.log_seq = row[9].as<int64_t>();
    if (!row[10].is_null()) {
      r.snapshot.max_key = row[10].as<std::string>();
    }
  }
  if (!row[11].is_null()) {
    r.backfill_cursor = row[11].as<std::string>();
  }
  r.backfill_complete = row[12].as<bool>();
  r.replay_watermark  = row[13].as<int64_t>();
  r.rows_copied       = row[14].as<uint64_t>();
  r.changes_applied   = row[15].as<uint64_t>();
  return r;
}

class PgTableLock final : public registry::TableLock {
 public:
  PgTableLock(std::unique_ptr<pqxx::connection> conn, model::TableName source)
      : conn_(std::move(conn)), source_(std::move(source)) {
  }

  ~PgTableLock() override {
    try {
      if (conn_->is_open()) {
        pqxx::nontransaction tx(*conn_);
        tx.exec_params("SELECT pg_advisory_unlock($1, hashtext($2));", kAdvisoryLockClass, source_.Qualified());
      }
    } catch (const std::exception& e) {
      // closing the session below releases it anyway
      PGSHADOW_LOG_WARN("advisory unlock failed", {observability::TableField("table", source_),
                                                   observability::ErrorField(e)});
    }
  }

 private:
  std::unique_ptr<pqxx::connection> conn_;
  model::TableName                  source_;
};

} // namespace

PgMigrationRegistry::PgMigrationRegistry(std::shared_ptr<PgPool> pool, std::string work_schema)
    : pool_(std::move(pool)),
      work_schema_(std::move(work_schema)),
      table_(model::RegistryTable(work_schema_).Qualified()) {
}

void PgMigrationRegistry::EnsureSchema() {
  PgTransaction tx(pool_);
  tx.Work().exec(registry::CreateRegistrySql(work_schema_));
  tx.Commit();
}

std::optional<model::MigrationRecord> PgMigrationRegistry::Find(const model::TableName& source) {
  PgTransaction tx(pool_);
  if (!PgCatalog::RelationExists(tx.Work(), model::RegistryTable(work_schema_))) {
    tx.Commit();
    return std::nullopt;
  }
  auto res = tx.Work().exec_params(std::string("SELECT ") + kSelectColumns + " FROM " + table_ +
                                       " WHERE source_schema = $1 AND source_name = $2;",
                                   source.schema, source.name);
  tx.Commit();

  if (res.empty()) {
    return std::nullopt;
  }
  return FromRow(res[0], work_schema_);
}

std::vector<model::MigrationRecord> PgMigrationRegistry::List() {
  PgTransaction tx(pool_);
  if (!PgCatalog::RelationExists(tx.Work(), model::RegistryTable(work_schema_))) {
    tx.Commit();
    return {};
  }
  auto res = tx.Work().exec(std::string("SELECT ") + kSelectColumns + " FROM " + table_ + " ORDER BY started_at;");
  tx.Commit();

  std::vector<model::MigrationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(FromRow(row, work_schema_));
  }
  return out;
}

void PgMigrationRegistry::Insert(const model::MigrationRecord& r) {
  PgTransaction tx(pool_);
  auto res = tx.Work().exec_params("INSERT INTO " + table_ +
                                       " (source_schema, source_name, shadow_name, log_name, target_ddl, phase, mode)"
                                       " VALUES ($1, $2, $3, $4, $5, $6, $7)"
                                       " ON CONFLICT (source_schema, source_name) DO NOTHING RETURNING 1;",
                                   r.source.schema, r.source.name, r.shadow.name, r.log.name, r.target_ddl,
                                   std::string(model::ToString(r.phase)), std::string(model::ToString(r.mode)));
  if (res.empty()) {
    throw util::MigrationConflict("a migration of " + r.source.Display() + " is already registered in " + table_);
  }
  tx.Commit();
}

void PgMigrationRegistry::UpdatePhase(const model::TableName& source, model::MigrationPhase phase) {
  PgTransaction tx(pool_);
  tx.Work().exec_params(registry::UpdatePhaseSql(work_schema_), source.schema, source.name, std::string(model::ToString(phase)));
  tx.Commit();
}

void PgMigrationRegistry::SaveSnapshot(const model::TableName& source, const model::Snapshot& snapshot) {
  PgTransaction tx(pool_);
  tx.Work().exec_params("UPDATE " + table_ +
                            " SET snapshot_seq = $3, snapshot_max_key = $4::jsonb, updated_at = now()"
                            " WHERE source_schema = $1 AND source_name = $2;",
                        source.schema, source.name, snapshot.log_seq, snapshot.max_key);
  tx.Commit();
}

void PgMigrationRegistry::Remove(const model::TableName& source) {
  PgTransaction tx(pool_);
  if (PgCatalog::RelationExists(tx.Work(), model::RegistryTable(work_schema_))) {
    tx.Work().exec_params("DELETE FROM " + table_ + " WHERE source_schema = $1 AND source_name = $2;", source.schema,
                          source.name);
  }
  tx.Commit();
}

PgTableLocker::PgTableLocker(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<registry::TableLock> PgTableLocker::TryLock(const model::TableName& source) {
  auto conn = pool_->OpenDedicated();

  bool acquired = false;
  {
    pqxx::nontransaction tx(*conn);
    auto res = tx.exec_params("SELECT pg_try_advisory_lock($1, hashtext($2));", kAdvisoryLockClass, source.Qualified());
    acquired = res[0][0].as<bool>();
  }

  if (!acquired) {
    return nullptr;
  }
  return std::make_unique<PgTableLock>(std::move(conn), source);
}

} // namespace pgshadow::db::postgres
