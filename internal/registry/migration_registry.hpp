#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/model/migration.hpp"

namespace pgshadow::registry {

/*
  MigrationRegistry

  One row per table under migration, in the work schema. The row's primary
  key on the source name is the durable half of one-migration-per-table;
  the advisory lock (TableLocker) is the live half.

  Cursor, watermark and counters are written by the backfill and replay
  transactions themselves so they commit atomically with the data they
  describe; the registry only reads them back.
*/
class MigrationRegistry {
 public:
  virtual ~MigrationRegistry() = default;

  // Creates the work schema and registry table if missing.
  virtual void EnsureSchema() = 0;

  virtual std::optional<model::MigrationRecord> Find(const model::TableName& source) = 0;

  virtual std::vector<model::MigrationRecord> List() = 0;

  // Throws util::MigrationConflict when a row already exists.
  virtual void Insert(const model::MigrationRecord& record) = 0;

  virtual void UpdatePhase(const model::TableName& source, model::MigrationPhase phase) = 0;

  // Written once, on entry into Backfilling.
  virtual void SaveSnapshot(const model::TableName& source, const model::Snapshot& snapshot) = 0;

  // No-op when absent.
  virtual void Remove(const model::TableName& source) = 0;
};

// Held while alive.
class TableLock {
 public:
  virtual ~TableLock() = default;
};

class TableLocker {
 public:
  virtual ~TableLocker() = default;

  // nullptr when another session holds the table.
  virtual std::unique_ptr<TableLock> TryLock(const model::TableName& source) = 0;
};

} // namespace pgshadow::registry
