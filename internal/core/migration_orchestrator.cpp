#include "migration_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "internal/backfill/backfill_engine.hpp"
#include "internal/capture/capture_installer.hpp"
#include "internal/catalog/schema_inspector.hpp"
#include "internal/cutover/swap_coordinator.hpp"
#include "internal/ddl/target_ddl.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/migration_registry.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/replay/replay_worker.hpp"
#include "internal/shadow/shadow_table_manager.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pgshadow::core {

using model::MigrationPhase;
using observability::BoolField;
using observability::IntField;
using observability::ErrorField;
using observability::StringField;
using observability::TableField;

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& n : names) {
    if (!out.empty()) out += ", ";
    out += n;
  }
  return out;
}

} // namespace

struct MigrationOrchestrator::Run {
  model::Migration                     migration;
  model::ArtifactNames                 names;
  bool                                 resumed = false;
  std::unique_ptr<registry::TableLock> lock;
  std::optional<catalog::TableInfo>    source_info;

  std::unique_ptr<replay::ReplayWorker> worker;
  uint64_t                              applied_base = 0;
  std::optional<std::string>            replay_failure;

  std::optional<model::TableName> archived;
  std::string                     abort_reason;
};

bool MigrationReport::Succeeded() const {
  if (phase == MigrationPhase::kDone) {
    return true;
  }
  return phase == MigrationPhase::kAborted && abort_reason.empty() && mode != model::RunMode::kExecute;
}

MigrationOrchestrator::MigrationOrchestrator(Components components, config::Settings settings)
    : components_(std::move(components)), settings_(std::move(settings)) {
  replay_engine_ = std::make_shared<replay::ReplayEngine>(components_.applier, settings_.replay, db::RetryPolicy(settings_.retry));
}

MigrationOrchestrator::~MigrationOrchestrator() = default;

void MigrationOrchestrator::Cancel() {
  stop_.Cancel();
}

// ------------------------------------------------------------
// Phase bookkeeping
// ------------------------------------------------------------

void MigrationOrchestrator::Transition(Run& run, MigrationPhase to, bool persist) {
  auto& m = run.migration;
  if (!model::CanTransition(m.phase, to)) {
    throw std::logic_error("invalid phase transition " + std::string(model::ToString(m.phase)) + " -> " +
                           std::string(model::ToString(to)));
  }
  if (persist && m.phase != to) {
    components_.registry->UpdatePhase(m.source, to);
  }

  PGSHADOW_LOG_INFO("phase transition", {TableField("table", m.source), StringField("from", model::ToString(m.phase)),
                                         StringField("to", model::ToString(to)),
                                         StringField("cursor", m.backfill_cursor.value_or("")),
                                         IntField("watermark", m.replay_watermark)});
  m.phase = to;
}

MigrationReport MigrationOrchestrator::Report(const Run& run) const {
  const auto&     m = run.migration;
  MigrationReport report;
  report.source           = m.source;
  report.phase            = m.phase;
  report.mode             = m.mode;
  report.archived         = run.archived;
  report.rows_copied      = m.rows_copied;
  report.changes_applied  = m.changes_applied;
  report.replay_watermark = m.replay_watermark;
  report.resumed          = run.resumed;
  report.abort_reason     = run.abort_reason;
  return report;
}

// ------------------------------------------------------------
// Init: everything here fails before any object is created
// ------------------------------------------------------------

void MigrationOrchestrator::ValidateSource(Run& run, const catalog::TableInfo& source) {
  const auto& m     = run.migration;
  const auto  table = source.name.Display();

  if (source.relkind != 'r' && source.relkind != 'p') {
    throw util::ValidationError(table + " is not a table");
  }
  if (source.is_partition) {
    throw util::ValidationError(table + " is a partition; migrate its parent table instead");
  }
  if (source.primary_key.empty()) {
    throw util::ValidationError(table + " has no primary key");
  }

  const auto deps = components_.inspector->FindDependents(source.name);
  if (!deps.views.empty()) {
    throw util::ValidationError("views depend on " + table + " and would follow the archived copy: " + JoinNames(deps.views));
  }
  if (!deps.inbound_foreign_keys.empty()) {
    throw util::ValidationError("foreign keys reference " + table + " and would follow the archived copy: " +
                                JoinNames(deps.inbound_foreign_keys));
  }
  if (!deps.outbound_foreign_keys.empty() && !m.redefines_table) {
    PGSHADOW_LOG_WARN("foreign keys are not cloned onto the new table; re-add them in the target DDL if needed",
                      {StringField("table", table), StringField("foreign_keys", JoinNames(deps.outbound_foreign_keys))});
  }
  if (!deps.user_triggers.empty()) {
    PGSHADOW_LOG_WARN("user triggers stay on the archived table",
                      {StringField("table", table), StringField("triggers", JoinNames(deps.user_triggers))});
  }

  const auto caps = components_.inspector->CheckCapabilities(source.name, settings_.migration.work_schema,
                                                             settings_.migration.archive_schema);
  std::vector<std::string> missing;
  if (!caps.owns_source) missing.push_back("ownership of " + table);
  if (!caps.can_trigger) missing.push_back("TRIGGER on " + table);
  if (!caps.can_create_in_source_schema) missing.push_back("CREATE on schema " + source.name.schema);
  if (!caps.can_create_work_schema) missing.push_back("CREATE on schema " + settings_.migration.work_schema);
  if (!caps.can_create_archive_schema) missing.push_back("CREATE on schema " + settings_.migration.archive_schema);
  if (!missing.empty()) {
    throw util::ConfigError("role " + caps.role + " lacks " + JoinNames(missing));
  }
  PGSHADOW_LOG_INFO("role capabilities checked", {StringField("role", caps.role), BoolField("can_replicate", caps.can_replicate)});

  // the shadow passes through the source schema under its own name at cutover
  const model::TableName staging{source.name.schema, m.shadow.name};
  if (staging != source.name && components_.inspector->RelationExists(staging)) {
    throw util::ValidationError(staging.Display() + " exists and would collide with the shadow during cutover");
  }
}

void MigrationOrchestrator::Prepare(Run& run, const std::string& target_ddl) {
  auto&      m   = run.migration;
  const auto ddl = ddl::TargetDdl::Parse(target_ddl);

  m.source            = ddl.source();
  run.names           = model::DeriveArtifactNames(m.source, settings_.migration.work_schema);
  m.shadow            = run.names.shadow;
  m.log               = run.names.log;
  m.target_ddl        = target_ddl;
  m.shadow_statements = ddl.RetargetTo(m.shadow);
  m.redefines_table   = ddl.redefines_table();
  m.column_renames    = ddl.column_renames();

  const auto server = components_.inspector->Server();
  PGSHADOW_LOG_INFO("connected", {StringField("server_version", server.version), IntField("server_version_num", server.version_num)});
  // row triggers on partitioned tables
  if (server.version_num < 110000) {
    throw util::ConfigError("PostgreSQL 11 or newer is required, server is " + server.version);
  }

  run.lock = components_.locker->TryLock(m.source);
  if (!run.lock) {
    throw util::MigrationConflict("another session is migrating " + m.source.Display());
  }

  auto source = components_.inspector->DescribeTable(m.source);
  if (!source) {
    throw util::ValidationError("table " + m.source.Display() + " does not exist");
  }

  const auto requested_mode = m.mode;
  const auto existing       = components_.registry->Find(m.source);
  // after a committed swap the source name already holds the new table
  if (!existing || existing->phase != MigrationPhase::kCleanup) {
    ValidateSource(run, *source);
  }
  run.source_info = *source;
  m.primary_key   = source->primary_key;

  if (existing) {
    const auto table = m.source.Display();
    if (!settings_.migration.resume) {
      throw util::MigrationConflict("a migration of " + table + " is registered in phase " +
                                    std::string(model::ToString(existing->phase)) + "; run `pgshadow abort --table " + table +
                                    "` or enable migration.resume");
    }
    if (existing->phase == MigrationPhase::kFailed) {
      throw util::MigrationConflict("the previous cutover of " + table + " failed; inspect the catalog and run `pgshadow abort --table " +
                                    table + "`");
    }
    if (existing->target_ddl != target_ddl) {
      throw util::MigrationConflict("a migration of " + table + " with different DDL is registered");
    }
    if (existing->mode != requested_mode) {
      throw util::MigrationConflict("the registered migration of " + table + " runs in " +
                                    std::string(model::ToString(existing->mode)) + " mode");
    }

    model::RestoreProgress(m, *existing);
    run.resumed = true;

    if (m.phase == MigrationPhase::kCutover) {
      // 'cutover' is never committed by a successful swap, so the swap rolled back
      components_.registry->UpdatePhase(m.source, MigrationPhase::kQuiescenceCheck);
      m.phase = MigrationPhase::kQuiescenceCheck;
    }

    PGSHADOW_LOG_INFO("resuming migration", {StringField("table", table), StringField("phase", model::ToString(m.phase)),
                                             StringField("cursor", m.backfill_cursor.value_or("")),
                                             IntField("watermark", m.replay_watermark)});
    return;
  }

  if (components_.inspector->RelationExists(m.shadow) || components_.inspector->RelationExists(m.log)) {
    throw util::ValidationError("leftover " + m.shadow.Display() + " or " + m.log.Display() +
                                " exists without a registered migration; drop it first");
  }

  components_.registry->EnsureSchema();
  m.started_at = util::Now();
  components_.registry->Insert(model::ToRecord(m));

  PGSHADOW_LOG_INFO("migration registered", {TableField("table", m.source), TableField("shadow", m.shadow),
                                             StringField("mode", model::ToString(m.mode))});
}

// ------------------------------------------------------------
// Shadow, capture, replay worker
// ------------------------------------------------------------

void MigrationOrchestrator::CreateShadowAndCapture(Run& run) {
  auto& m = run.migration;

  if (run.resumed) {
    // an earlier run stopped before capture was recorded; start over
    TeardownArtifacts(m.source, run.names);
  }

  const shadow::ShadowSpec spec{m.source, m.shadow, m.shadow_statements, m.redefines_table, m.column_renames};
  const auto               layout = components_.shadows->Create(spec, *run.source_info);
  m.column_map                    = layout.column_map;
  m.shadow_key                    = layout.shadow_key;
  m.conflict_key                  = layout.conflict_key;

  components_.capture->Install(m.source, m.primary_key, run.names);
  Transition(run, MigrationPhase::kCapturingInstalled);
}

void MigrationOrchestrator::ReloadShadowAndCapture(Run& run) {
  auto& m = run.migration;

  const shadow::ShadowSpec spec{m.source, m.shadow, m.shadow_statements, m.redefines_table, m.column_renames};
  const auto               layout = components_.shadows->Load(spec, *run.source_info);
  m.column_map                    = layout.column_map;
  m.shadow_key                    = layout.shadow_key;
  m.conflict_key                  = layout.conflict_key;

  components_.capture->Install(m.source, m.primary_key, run.names);
}

void MigrationOrchestrator::StartReplay(Run& run) {
  run.applied_base = run.migration.changes_applied;
  run.worker       = std::make_unique<replay::ReplayWorker>(replay_engine_, run.migration, [this] { stop_.Cancel(); });
  run.worker->Start();
}

void MigrationOrchestrator::StopReplay(Run& run) {
  if (!run.worker) {
    return;
  }
  run.worker->Stop();

  auto& m            = run.migration;
  m.replay_watermark = std::max(m.replay_watermark, run.worker->watermark());
  m.changes_applied  = run.applied_base + run.worker->applied();
  run.replay_failure = run.worker->failure();
  run.worker.reset();
}

void MigrationOrchestrator::ThrowIfReplayFailed(Run& run) {
  const auto failure = run.worker ? run.worker->failure() : run.replay_failure;
  if (failure) {
    throw std::runtime_error("replay of " + run.migration.source.Display() + " failed: " + *failure);
  }
}

// ------------------------------------------------------------
// Backfill, quiescence
// ------------------------------------------------------------

bool MigrationOrchestrator::RunBackfill(Run& run) {
  auto&                 m = run.migration;
  const db::RetryPolicy retry(settings_.retry);

  if (!m.snapshot.taken) {
    m.snapshot = retry.Run("take snapshot", &stop_, [&] { return components_.copier->TakeSnapshot(m); });
    components_.registry->SaveSnapshot(m.source, m.snapshot);
    PGSHADOW_LOG_INFO("snapshot taken", {TableField("table", m.source), IntField("log_seq", m.snapshot.log_seq),
                                         StringField("max_key", m.snapshot.max_key.value_or(""))});
  }

  backfill::BackfillEngine engine(components_.copier, settings_.backfill, retry);
  const bool               done = engine.Run(m, stop_);
  ThrowIfReplayFailed(run);
  return done;
}

bool MigrationOrchestrator::AwaitQuiescence(Run& run) {
  using Clock = std::chrono::steady_clock;

  const auto&                      m       = run.migration;
  const auto&                      q       = settings_.quiescence;
  const auto                       started = Clock::now();
  std::optional<Clock::time_point> stable_since;

  for (;;) {
    if (stop_.IsCancelled()) {
      ThrowIfReplayFailed(run);
      run.abort_reason = "cancelled during quiescence check";
      return false;
    }

    const auto backlog = replay_engine_->Backlog(m);
    const auto now     = Clock::now();

    if (backlog == 0) {
      if (!stable_since) {
        stable_since = now;
      }
      if (now - *stable_since >= q.window) {
        PGSHADOW_LOG_INFO("backlog quiescent", {TableField("table", m.source),
                                                IntField("window_ms", static_cast<int64_t>(q.window.count()))});
        return true;
      }
    } else {
      stable_since.reset();
    }

    if (q.max_wait.count() > 0 && now - started >= q.max_wait) {
      run.abort_reason = "backlog did not settle within " + std::to_string(q.max_wait.count()) + "ms";
      return false;
    }

    PGSHADOW_LOG_DEBUG("waiting for quiescence", {TableField("table", m.source), IntField("backlog", static_cast<int64_t>(backlog))});
    stop_.WaitFor(q.poll_interval);
  }
}

void MigrationOrchestrator::WaitForCancel(Run& run) {
  while (!stop_.WaitFor(std::chrono::seconds(10))) {
    PGSHADOW_LOG_INFO("replaying", {TableField("table", run.migration.source),
                                    IntField("watermark", run.worker->watermark()),
                                    IntField("consumed", static_cast<int64_t>(run.worker->consumed()))});
  }
  ThrowIfReplayFailed(run);
}

// ------------------------------------------------------------
// Cutover, cleanup, abort
// ------------------------------------------------------------

void MigrationOrchestrator::Cutover(Run& run) {
  auto& m = run.migration;

  Transition(run, MigrationPhase::kCutover);
  StopReplay(run);
  ThrowIfReplayFailed(run);

  const auto& co = settings_.cutover;
  for (uint32_t attempt = 1; attempt <= co.max_attempts; ++attempt) {
    if (stop_.IsCancelled()) {
      Teardown(run, "cancelled before cutover");
      return;
    }

    cutover::SwapOutcome outcome;
    try {
      outcome = components_.swapper->Swap(m);
    } catch (const util::CutoverError& e) {
      try {
        components_.registry->UpdatePhase(m.source, MigrationPhase::kFailed);
      } catch (const std::exception& persist_error) {
        PGSHADOW_LOG_ERROR("could not record failed phase", {TableField("table", m.source),
                                                             ErrorField(persist_error)});
      }
      Transition(run, MigrationPhase::kFailed, false);
      PGSHADOW_LOG_ERROR("migration failed", {TableField("table", m.source), StringField("phase", "cutover"),
                                              StringField("cursor", m.backfill_cursor.value_or("")),
                                              IntField("watermark", m.replay_watermark), ErrorField(e)});
      throw;
    }

    if (outcome.swapped) {
      m.changes_applied += outcome.drained;
      run.archived = outcome.plan.archived;
      // the swap transaction recorded 'cleanup' itself
      Transition(run, MigrationPhase::kCleanup, false);
      return;
    }

    PGSHADOW_LOG_WARN("cutover attempt timed out on the table lock",
                      {TableField("table", m.source), IntField("attempt", attempt), IntField("max_attempts", co.max_attempts)});
    if (attempt < co.max_attempts) {
      stop_.WaitFor(co.retry_delay);
      // keep the next attempt's drain under the exclusive lock short
      replay_engine_->DrainAll(m, &stop_);
    }
  }

  Teardown(run, "cutover lock not acquired after " + std::to_string(co.max_attempts) + " attempts");
}

void MigrationOrchestrator::Cleanup(Run& run, const model::TableName& triggers_on) {
  auto& m = run.migration;
  StopReplay(run);
  if (m.phase != MigrationPhase::kCleanup) {
    Transition(run, MigrationPhase::kCleanup);
  }

  // the swap is committed; nothing below may undo it
  try {
    components_.capture->Uninstall(triggers_on, run.names);
  } catch (const std::exception& e) {
    PGSHADOW_LOG_ERROR("cleanup: removing capture failed", {TableField("table", triggers_on), ErrorField(e)});
  }
  try {
    components_.capture->DropLog(run.names);
  } catch (const std::exception& e) {
    PGSHADOW_LOG_ERROR("cleanup: dropping change log failed", {TableField("log", m.log), ErrorField(e)});
  }
  try {
    components_.registry->Remove(m.source);
  } catch (const std::exception& e) {
    PGSHADOW_LOG_ERROR("cleanup: removing registry row failed", {TableField("table", m.source), ErrorField(e)});
  }

  Transition(run, MigrationPhase::kDone, false);
  PGSHADOW_LOG_INFO("migration complete", {TableField("table", m.source),
                                           StringField("archived", run.archived ? run.archived->Display() : "unknown"),
                                           IntField("rows_copied", static_cast<int64_t>(m.rows_copied)),
                                           IntField("changes_applied", static_cast<int64_t>(m.changes_applied))});
}

void MigrationOrchestrator::TeardownArtifacts(const model::TableName& source, const model::ArtifactNames& names) {
  // triggers first so nothing writes to the log while it is dropped
  components_.capture->Uninstall(source, names);
  components_.capture->DropLog(names);
  components_.shadows->Drop(names.shadow);
}

void MigrationOrchestrator::Teardown(Run& run, const std::string& reason) {
  auto& m = run.migration;
  if (m.phase != MigrationPhase::kAborting) {
    Transition(run, MigrationPhase::kAborting);
  }
  StopReplay(run);

  TeardownArtifacts(m.source, run.names);
  components_.registry->Remove(m.source);

  run.abort_reason = reason;
  Transition(run, MigrationPhase::kAborted, false);

  if (reason.empty()) {
    PGSHADOW_LOG_INFO("shadow torn down as planned", {TableField("table", m.source), StringField("mode", model::ToString(m.mode)),
                                                      IntField("rows_copied", static_cast<int64_t>(m.rows_copied)),
                                                      IntField("changes_applied", static_cast<int64_t>(m.changes_applied))});
  } else {
    PGSHADOW_LOG_WARN("migration aborted; source table untouched", {TableField("table", m.source), StringField("reason", reason)});
  }
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

MigrationReport MigrationOrchestrator::Migrate(const std::string& target_ddl, model::RunMode mode) {
  Run run;
  run.migration.mode = mode;
  Prepare(run, target_ddl);

  auto& m = run.migration;
  try {
    if (m.phase == MigrationPhase::kAborting) {
      Teardown(run, "resumed an interrupted abort");
      return Report(run);
    }
    if (m.phase == MigrationPhase::kCleanup) {
      Cleanup(run, m.source);
      return Report(run);
    }

    if (m.phase == MigrationPhase::kInit) {
      CreateShadowAndCapture(run);
    } else {
      ReloadShadowAndCapture(run);
    }
    StartReplay(run);

    if (mode == model::RunMode::kReplayOnly) {
      Transition(run, MigrationPhase::kReplaying);
      WaitForCancel(run);
      Teardown(run, "");
      return Report(run);
    }

    if (m.phase == MigrationPhase::kCapturingInstalled) {
      Transition(run, MigrationPhase::kBackfilling);
    }
    if (m.phase == MigrationPhase::kBackfilling) {
      if (!RunBackfill(run)) {
        Teardown(run, "cancelled during backfill");
        return Report(run);
      }
      Transition(run, MigrationPhase::kReplaying);
    }
    if (m.phase == MigrationPhase::kReplaying) {
      Transition(run, MigrationPhase::kQuiescenceCheck);
    }

    if (!AwaitQuiescence(run)) {
      Teardown(run, run.abort_reason);
      return Report(run);
    }

    if (mode == model::RunMode::kRehearsal) {
      PGSHADOW_LOG_INFO("rehearsal converged; shadow was fully built", {TableField("table", m.source)});
      Teardown(run, "");
      return Report(run);
    }

    Cutover(run);
    if (m.phase == MigrationPhase::kCleanup) {
      Cleanup(run, *run.archived);
    }
    return Report(run);
  } catch (const util::CutoverError&) {
    throw;
  } catch (const util::Cancelled& e) {
    if (!model::IsBeforeCutover(m.phase) && m.phase != MigrationPhase::kCutover) {
      throw;
    }
    StopReplay(run);
    Teardown(run, run.replay_failure ? "replay failed: " + *run.replay_failure : std::string(e.what()));
    return Report(run);
  } catch (const std::exception& e) {
    PGSHADOW_LOG_ERROR("migration error", {TableField("table", m.source), StringField("phase", model::ToString(m.phase)),
                                           StringField("cursor", m.backfill_cursor.value_or("")),
                                           IntField("watermark", m.replay_watermark), ErrorField(e)});
    if (model::IsBeforeCutover(m.phase) || m.phase == MigrationPhase::kCutover || m.phase == MigrationPhase::kAborting) {
      try {
        Teardown(run, e.what());
      } catch (const std::exception& teardown_error) {
        PGSHADOW_LOG_ERROR("abort did not finish; run `pgshadow abort` for this table",
                           {TableField("table", m.source), ErrorField(teardown_error)});
      }
    }
    throw;
  }
}

MigrationReport MigrationOrchestrator::Abort(const model::TableName& source) {
  Run   run;
  auto& m = run.migration;

  run.lock = components_.locker->TryLock(source);
  if (!run.lock) {
    throw util::MigrationConflict("another session is migrating " + source.Display());
  }

  const auto record = components_.registry->Find(source);
  if (!record) {
    throw util::ValidationError("no migration of " + source.Display() + " is registered");
  }

  m.source     = record->source;
  m.shadow     = record->shadow;
  m.log        = record->log;
  m.target_ddl = record->target_ddl;
  m.mode       = record->mode;
  model::RestoreProgress(m, *record);
  run.names = model::DeriveArtifactNames(m.source, settings_.migration.work_schema);

  PGSHADOW_LOG_INFO("operator abort", {TableField("table", m.source), StringField("phase", model::ToString(m.phase))});

  if (m.phase == MigrationPhase::kCleanup) {
    PGSHADOW_LOG_WARN("swap already committed; finishing cleanup instead", {TableField("table", m.source)});
    Cleanup(run, m.source);
    return Report(run);
  }

  if (m.phase == MigrationPhase::kFailed) {
    // the swap transaction is atomic: either the shadow is still in the
    // work schema (rolled back) or it became the source (committed)
    if (components_.shadows->Exists(m.shadow)) {
      TeardownArtifacts(m.source, run.names);
      components_.registry->Remove(m.source);
      m.phase = MigrationPhase::kAborted;
      run.abort_reason = "operator abort after failed cutover";
    } else {
      m.phase = MigrationPhase::kCleanup;
      Cleanup(run, m.source);
    }
    return Report(run);
  }

  Teardown(run, "operator abort");
  return Report(run);
}

std::vector<StatusEntry> MigrationOrchestrator::Status() {
  std::vector<StatusEntry> out;
  for (auto& record : components_.registry->List()) {
    StatusEntry entry;
    entry.record = record;

    model::Migration m;
    m.source = record.source;
    m.log    = record.log;
    try {
      entry.backlog = components_.applier->Backlog(m);
    } catch (const std::exception& e) {
      PGSHADOW_LOG_WARN("backlog unavailable", {TableField("log", record.log), ErrorField(e)});
    }
    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace pgshadow::core
