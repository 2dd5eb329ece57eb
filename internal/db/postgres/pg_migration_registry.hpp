#pragma once

#include <memory>
#include <string>

#include "internal/registry/migration_registry.hpp"
#include "pg_pool.hpp"

namespace pgshadow::db::postgres {

class PgMigrationRegistry final : public registry::MigrationRegistry {
 public:
  PgMigrationRegistry(std::shared_ptr<PgPool> pool, std::string work_schema);

  void EnsureSchema() override;

  std::optional<model::MigrationRecord> Find(const model::TableName& source) override;
  std::vector<model::MigrationRecord>   List() override;

  void Insert(const model::MigrationRecord& record) override;
  void UpdatePhase(const model::TableName& source, model::MigrationPhase phase) override;
  void SaveSnapshot(const model::TableName& source, const model::Snapshot& snapshot) override;
  void Remove(const model::TableName& source) override;

 private:
  std::shared_ptr<PgPool> pool_;
  std::string             work_schema_;
  std::string             table_;
};

/*
  Session-level advisory lock keyed on the source table, held on a
  dedicated connection that lives exactly as long as the lock object. A
  crashed process releases it when its session ends.
*/
class PgTableLocker final : public registry::TableLocker {
 public:
  explicit PgTableLocker(std::shared_ptr<PgPool> pool);

  std::unique_ptr<registry::TableLock> TryLock(const model::TableName& source) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace pgshadow::db::postgres
