#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/model/migration.hpp"
#include "internal/model/naming.hpp"
#include "internal/util/cancellation.hpp"

namespace pgshadow::catalog {
class SchemaInspector;
struct TableInfo;
}
namespace pgshadow::registry {
class MigrationRegistry;
class TableLocker;
}
namespace pgshadow::capture {
class CaptureInstaller;
}
namespace pgshadow::shadow {
class ShadowTableManager;
}
namespace pgshadow::backfill {
class ChunkCopier;
}
namespace pgshadow::replay {
class ChangeApplier;
class ReplayEngine;
class ReplayWorker;
}
namespace pgshadow::cutover {
class SwapCoordinator;
}

namespace pgshadow::core {

struct Components {
  std::shared_ptr<catalog::SchemaInspector>    inspector;
  std::shared_ptr<registry::MigrationRegistry> registry;
  std::shared_ptr<registry::TableLocker>       locker;
  std::shared_ptr<capture::CaptureInstaller>   capture;
  std::shared_ptr<shadow::ShadowTableManager>  shadows;
  std::shared_ptr<backfill::ChunkCopier>       copier;
  std::shared_ptr<replay::ChangeApplier>       applier;
  std::shared_ptr<cutover::SwapCoordinator>    swapper;
};

struct MigrationReport {
  model::TableName                source;
  model::MigrationPhase           phase = model::MigrationPhase::kInit;
  model::RunMode                  mode  = model::RunMode::kExecute;
  std::optional<model::TableName> archived;
  uint64_t                        rows_copied      = 0;
  uint64_t                        changes_applied  = 0;
  int64_t                         replay_watermark = 0;
  bool                            resumed          = false;
  // set when the run ended on the abort path for a reason other than the mode
  std::string                     abort_reason;

  // Done after a swap, or the planned teardown of a rehearsal / replay-only run.
  bool Succeeded() const;
};

struct StatusEntry {
  model::MigrationRecord  record;
  // absent when the log could not be read
  std::optional<uint64_t> backlog;
};

/*
  MigrationOrchestrator

  Sequences one migration through its phases and owns the failure contract:

  - Before cutover every error leads to the abort path, which removes
    triggers, log, shadow and registry row and leaves the source untouched.
  - Cutover failures other than lock timeouts are terminal (Failed) and are
    left for an operator; the registry row stays for inspection.
  - Every transition is persisted so a restarted process resumes from the
    registry row.

  Migrate() blocks; Cancel() may be called from any thread and is honoured
  between units of work.
*/
class MigrationOrchestrator {
 public:
  MigrationOrchestrator(Components components, config::Settings settings);
  ~MigrationOrchestrator();

  MigrationReport Migrate(const std::string& target_ddl, model::RunMode mode);

  // Operator abort of a registered migration, e.g. after a crash or a Failed cutover.
  MigrationReport Abort(const model::TableName& source);

  std::vector<StatusEntry> Status();

  void Cancel();

 private:
  struct Run;

  void Transition(Run& run, model::MigrationPhase to, bool persist = true);

  void Prepare(Run& run, const std::string& target_ddl);
  void ValidateSource(Run& run, const catalog::TableInfo& source);

  void CreateShadowAndCapture(Run& run);
  void ReloadShadowAndCapture(Run& run);
  void StartReplay(Run& run);
  void StopReplay(Run& run);
  bool RunBackfill(Run& run);
  bool AwaitQuiescence(Run& run);
  void WaitForCancel(Run& run);
  void Cutover(Run& run);
  void Cleanup(Run& run, const model::TableName& triggers_on);
  void Teardown(Run& run, const std::string& reason);
  void TeardownArtifacts(const model::TableName& source, const model::ArtifactNames& names);

  void             ThrowIfReplayFailed(Run& run);
  MigrationReport  Report(const Run& run) const;

  Components       components_;
  config::Settings settings_;

  std::shared_ptr<replay::ReplayEngine> replay_engine_;

  util::Cancellation stop_;
};

} // namespace pgshadow::core
