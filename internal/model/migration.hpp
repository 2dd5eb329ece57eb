#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"
#include "column_map.hpp"
#include "columns.hpp"
#include "migration_phase.hpp"
#include "table_name.hpp"

namespace pgshadow::model {

enum class RunMode : std::uint8_t {
  kExecute,     // swap on success
  kRehearsal,   // build and converge the shadow, then tear it down
  kReplayOnly,  // capture and replay until stopped, then tear down
};

constexpr std::string_view ToString(RunMode mode) {
  switch (mode) {
    case RunMode::kRehearsal:
      return "rehearsal";
    case RunMode::kReplayOnly:
      return "replay_only";
    case RunMode::kExecute:
    default:
      return "execute";
  }
}

constexpr std::optional<RunMode> ParseRunMode(std::string_view text) {
  for (auto mode : {RunMode::kExecute, RunMode::kRehearsal, RunMode::kReplayOnly}) {
    if (ToString(mode) == text) {
      return mode;
    }
  }
  return std::nullopt;
}

/*
  Reference point taken on entry into Backfilling.

  Backfill copies keys up to max_key; any key with a change record newer
  than log_seq belongs to replay.
*/
struct Snapshot {
  bool                       taken   = false;
  int64_t                    log_seq = 0;
  // JSON array of key text values; absent when the source was empty
  std::optional<std::string> max_key;
};

/*
  Migration

  One run against one source table. Owned by the orchestrator; the durable
  subset (phase, snapshot, cursor, watermark, counters) is mirrored in the
  registry row and reloaded on resume.
*/
struct Migration {
  TableName source;
  TableName shadow;
  TableName log;

  std::string target_ddl;
  // target DDL retargeted at `shadow`, in execution order
  std::vector<std::string>           shadow_statements;
  bool                               redefines_table = false;
  std::map<std::string, std::string> column_renames;

  PrimaryKey primary_key;
  // shadow columns mapped from primary_key, in source key order
  PrimaryKey shadow_key;
  // the shadow's own primary key; a superset of shadow_key
  PrimaryKey conflict_key;
  ColumnMap  column_map;

  MigrationPhase  phase = MigrationPhase::kInit;
  util::TimePoint started_at{};

  Snapshot                   snapshot;
  std::optional<std::string> backfill_cursor;
  bool                       backfill_complete = false;
  int64_t                    replay_watermark  = 0;
  uint64_t                   rows_copied       = 0;
  uint64_t                   changes_applied   = 0;

  RunMode mode = RunMode::kExecute;

  bool KeyWidened() const {
    return conflict_key.columns.size() > shadow_key.columns.size();
  }
};

/*
  Durable subset of Migration, one row per source table in the registry.
*/
struct MigrationRecord {
  TableName       source;
  TableName       shadow;
  TableName       log;
  std::string     target_ddl;
  MigrationPhase  phase     = MigrationPhase::kInit;
  RunMode         mode      = RunMode::kExecute;
  util::TimePoint started_at{};
  util::TimePoint updated_at{};

  Snapshot                   snapshot;
  std::optional<std::string> backfill_cursor;
  bool                       backfill_complete = false;
  int64_t                    replay_watermark  = 0;
  uint64_t                   rows_copied       = 0;
  uint64_t                   changes_applied   = 0;
};

inline MigrationRecord ToRecord(const Migration& m) {
  MigrationRecord r;
  r.source            = m.source;
  r.shadow            = m.shadow;
  r.log               = m.log;
  r.target_ddl        = m.target_ddl;
  r.phase             = m.phase;
  r.mode              = m.mode;
  r.started_at        = m.started_at;
  r.snapshot          = m.snapshot;
  r.backfill_cursor   = m.backfill_cursor;
  r.backfill_complete = m.backfill_complete;
  r.replay_watermark  = m.replay_watermark;
  r.rows_copied       = m.rows_copied;
  r.changes_applied   = m.changes_applied;
  return r;
}

// Progress fields only; identity and DDL come from the current invocation.
inline void RestoreProgress(Migration& m, const MigrationRecord& r) {
  m.phase             = r.phase;
  m.started_at        = r.started_at;
  m.snapshot          = r.snapshot;
  m.backfill_cursor   = r.backfill_cursor;
  m.backfill_complete = r.backfill_complete;
  m.replay_watermark  = r.replay_watermark;
  m.rows_copied       = r.rows_copied;
  m.changes_applied   = r.changes_applied;
}

} // namespace pgshadow::model
