#include "internal/core/migration_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/backfill/chunk_copier.hpp"
#include "internal/capture/capture_installer.hpp"
#include "internal/catalog/schema_inspector.hpp"
#include "internal/cutover/swap_coordinator.hpp"
#include "internal/registry/migration_registry.hpp"
#include "internal/replay/change_applier.hpp"
#include "internal/shadow/shadow_table_manager.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace pgshadow;
using model::MigrationPhase;
using model::RunMode;
using namespace std::chrono_literals;

constexpr char kDdl[] = "ALTER TABLE public.accounts ADD COLUMN currency text NOT NULL DEFAULT 'USD';";

const model::TableName kSource{"public", "accounts"};
const model::TableName kShadow{"pgshadow", "public__accounts"};
const model::TableName kLog{"pgshadow", "public__accounts__log"};
const model::TableName kArchived{"pgshadow_archive", "accounts_20261018000000"};

std::string Key(const model::TableName& t) {
  return t.schema + "." + t.name;
}

std::string KeyOf(int id) {
  return "[\"" + std::to_string(id) + "\"]";
}

int IdOf(const std::string& key) {
  return std::stoi(key.substr(2, key.size() - 4));
}

enum class SwapBehavior { kSwap, kTimeout, kFail };

/*
  In-memory stand-in for one database: the relations that exist, where
  capture triggers sit, the registry rows and the change log backlog.
*/
struct FakeDb {
  std::mutex mu;

  std::set<std::string>                          relations{Key(kSource)};
  std::set<std::string>                          triggers_on;
  std::map<std::string, model::MigrationRecord> registry;
  std::set<std::string>                          locked;

  int  server_version_num = 160002;
  bool source_has_key     = true;
  int  source_rows        = 25;

  catalog::Dependents dependents;

  // change log
  uint64_t pending      = 0;
  int64_t  seq          = 0;
  bool     replay_fails = false;
  int      apply_calls  = 0;

  std::vector<SwapBehavior> swaps;
  int                       swap_calls = 0;

  int                      shadow_creates = 0;
  int                      shadow_loads   = 0;
  std::vector<std::string> chunk_cursors;

  bool Has(const model::TableName& t) {
    std::lock_guard lock(mu);
    return relations.count(Key(t)) > 0;
  }

  bool HasTriggers(const model::TableName& t) {
    std::lock_guard lock(mu);
    return triggers_on.count(Key(t)) > 0;
  }

  std::optional<model::MigrationRecord> Row() {
    std::lock_guard lock(mu);
    auto            it = registry.find(Key(kSource));
    if (it == registry.end()) return std::nullopt;
    return it->second;
  }
};

std::vector<model::Column> SourceColumns() {
  model::Column id;
  id.name     = "id";
  id.type     = "bigint";
  id.not_null = true;
  model::Column balance;
  balance.name = "balance";
  balance.type = "numeric";
  return {id, balance};
}

class FakeInspector final : public catalog::SchemaInspector {
 public:
  explicit FakeInspector(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  catalog::ServerInfo Server() override {
    return {db_->server_version_num, "PostgreSQL " + std::to_string(db_->server_version_num)};
  }

  std::optional<catalog::TableInfo> DescribeTable(const model::TableName& table) override {
    if (!db_->Has(table)) return std::nullopt;
    catalog::TableInfo info;
    info.name    = table;
    info.columns = SourceColumns();
    if (db_->source_has_key) info.primary_key.columns = {info.columns[0]};
    return info;
  }

  catalog::Dependents FindDependents(const model::TableName&) override {
    return db_->dependents;
  }

  catalog::RoleCapabilities CheckCapabilities(const model::TableName&, const std::string&, const std::string&) override {
    catalog::RoleCapabilities caps;
    caps.role                        = "migrator";
    caps.owns_source                 = true;
    caps.can_trigger                 = true;
    caps.can_create_in_source_schema = true;
    caps.can_create_work_schema      = true;
    caps.can_create_archive_schema   = true;
    return caps;
  }

  bool RelationExists(const model::TableName& name) override {
    return db_->Has(name);
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeRegistry final : public registry::MigrationRegistry {
 public:
  explicit FakeRegistry(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  void EnsureSchema() override {
  }

  std::optional<model::MigrationRecord> Find(const model::TableName& source) override {
    std::lock_guard lock(db_->mu);
    auto            it = db_->registry.find(Key(source));
    if (it == db_->registry.end()) return std::nullopt;
    return it->second;
  }

  std::vector<model::MigrationRecord> List() override {
    std::lock_guard                     lock(db_->mu);
    std::vector<model::MigrationRecord> out;
    for (const auto& [_, r] : db_->registry) out.push_back(r);
    return out;
  }

  void Insert(const model::MigrationRecord& record) override {
    std::lock_guard lock(db_->mu);
    if (!db_->registry.emplace(Key(record.source), record).second) {
      throw util::MigrationConflict("row exists");
    }
  }

  void UpdatePhase(const model::TableName& source, MigrationPhase phase) override {
    std::lock_guard lock(db_->mu);
    auto            it = db_->registry.find(Key(source));
    if (it != db_->registry.end()) it->second.phase = phase;
  }

  void SaveSnapshot(const model::TableName& source, const model::Snapshot& snapshot) override {
    std::lock_guard lock(db_->mu);
    db_->registry.at(Key(source)).snapshot = snapshot;
  }

  void Remove(const model::TableName& source) override {
    std::lock_guard lock(db_->mu);
    db_->registry.erase(Key(source));
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeLock final : public registry::TableLock {
 public:
  FakeLock(std::shared_ptr<FakeDb> db, std::string key) : db_(std::move(db)), key_(std::move(key)) {
  }

  ~FakeLock() override {
    std::lock_guard lock(db_->mu);
    db_->locked.erase(key_);
  }

 private:
  std::shared_ptr<FakeDb> db_;
  std::string             key_;
};

class FakeLocker final : public registry::TableLocker {
 public:
  explicit FakeLocker(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  std::unique_ptr<registry::TableLock> TryLock(const model::TableName& source) override {
    std::lock_guard lock(db_->mu);
    if (!db_->locked.insert(Key(source)).second) return nullptr;
    return std::make_unique<FakeLock>(db_, Key(source));
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeCapture final : public capture::CaptureInstaller {
 public:
  explicit FakeCapture(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  void Install(const model::TableName& source, const model::PrimaryKey&, const model::ArtifactNames& names) override {
    std::lock_guard lock(db_->mu);
    db_->relations.insert(Key(names.log));
    db_->triggers_on.insert(Key(source));
  }

  void Uninstall(const model::TableName& triggers_on, const model::ArtifactNames&) override {
    std::lock_guard lock(db_->mu);
    db_->triggers_on.erase(Key(triggers_on));
  }

  void DropLog(const model::ArtifactNames& names) override {
    std::lock_guard lock(db_->mu);
    db_->relations.erase(Key(names.log));
    db_->pending = 0;
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeShadows final : public shadow::ShadowTableManager {
 public:
  explicit FakeShadows(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  shadow::ShadowLayout Create(const shadow::ShadowSpec& spec, const catalog::TableInfo& source) override {
    {
      std::lock_guard lock(db_->mu);
      if (!db_->relations.insert(Key(spec.shadow)).second) throw util::ValidationError("shadow exists");
      ++db_->shadow_creates;
    }
    return Layout(source);
  }

  shadow::ShadowLayout Load(const shadow::ShadowSpec& spec, const catalog::TableInfo& source) override {
    if (!db_->Has(spec.shadow)) throw util::ValidationError("shadow missing");
    {
      std::lock_guard lock(db_->mu);
      ++db_->shadow_loads;
    }
    return Layout(source);
  }

  bool Exists(const model::TableName& shadow) override {
    return db_->Has(shadow);
  }

  void Drop(const model::TableName& shadow) override {
    std::lock_guard lock(db_->mu);
    db_->relations.erase(Key(shadow));
  }

 private:
  static shadow::ShadowLayout Layout(const catalog::TableInfo& source) {
    auto shadow_columns = source.columns;
    model::Column currency;
    currency.name = "currency";
    currency.type = "text";
    shadow_columns.push_back(currency);

    shadow::ShadowLayout layout;
    layout.column_map = model::ColumnMap::Build(source.columns, shadow_columns);
    layout.column_map.SetUpdatableExcluding(source.primary_key.Names(), shadow_columns);
    layout.shadow_key   = source.primary_key;
    layout.conflict_key = source.primary_key;
    return layout;
  }

  std::shared_ptr<FakeDb> db_;
};

class FakeCopier final : public backfill::ChunkCopier {
 public:
  explicit FakeCopier(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  model::Snapshot TakeSnapshot(const model::Migration&) override {
    std::lock_guard lock(db_->mu);
    model::Snapshot s;
    s.taken   = true;
    s.log_seq = db_->seq;
    if (db_->source_rows > 0) s.max_key = KeyOf(db_->source_rows);
    return s;
  }

  backfill::ChunkResult CopyChunk(const model::Migration&, const std::optional<std::string>& cursor, uint32_t limit) override {
    std::lock_guard lock(db_->mu);
    db_->chunk_cursors.push_back(cursor.value_or(""));

    backfill::ChunkResult result;
    const int start = cursor ? IdOf(*cursor) + 1 : 1;
    for (int id = start; id <= db_->source_rows && result.scanned < limit; ++id) {
      ++result.scanned;
      ++result.copied;
      result.last_key = KeyOf(id);
    }
    return result;
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeApplier final : public replay::ChangeApplier {
 public:
  explicit FakeApplier(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  replay::BatchResult ApplyBatch(const model::Migration&, uint32_t batch_size) override {
    std::lock_guard lock(db_->mu);
    ++db_->apply_calls;
    if (db_->replay_fails) {
      throw std::runtime_error("change log row has no key");
    }
    replay::BatchResult result;
    result.consumed = std::min<uint64_t>(batch_size, db_->pending);
    result.applied  = result.consumed;
    db_->pending -= result.consumed;
    db_->seq += static_cast<int64_t>(result.consumed);
    result.max_seq = result.consumed > 0 ? db_->seq : 0;
    return result;
  }

  uint64_t Backlog(const model::Migration&) override {
    std::lock_guard lock(db_->mu);
    return db_->pending;
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

class FakeSwapper final : public cutover::SwapCoordinator {
 public:
  explicit FakeSwapper(std::shared_ptr<FakeDb> db) : db_(std::move(db)) {
  }

  cutover::SwapOutcome Swap(const model::Migration& m) override {
    std::lock_guard lock(db_->mu);
    const auto      behavior = db_->swap_calls < static_cast<int>(db_->swaps.size()) ? db_->swaps[db_->swap_calls] : SwapBehavior::kSwap;
    ++db_->swap_calls;

    cutover::SwapOutcome outcome;
    outcome.plan = {m.source, m.shadow, kArchived};
    if (behavior == SwapBehavior::kTimeout) {
      return outcome;
    }
    if (behavior == SwapBehavior::kFail) {
      throw util::CutoverError("swap failed at step shadow_moved; source=" + Key(m.source) + " shadow=" + Key(m.shadow));
    }

    outcome.drained = db_->pending;
    db_->pending    = 0;
    db_->relations.erase(Key(m.shadow));
    db_->relations.insert(Key(kArchived));
    db_->triggers_on.erase(Key(m.source));
    db_->triggers_on.insert(Key(kArchived));
    db_->registry.at(Key(m.source)).phase = MigrationPhase::kCleanup;
    outcome.swapped = true;
    return outcome;
  }

  void SetStepHook(StepHook) override {
  }

 private:
  std::shared_ptr<FakeDb> db_;
};

config::Settings FastSettings() {
  config::Settings s;
  s.backfill.chunk_size       = 10;
  s.replay.batch_size         = 8;
  s.replay.poll_interval      = 1ms;
  s.quiescence.window         = 10ms;
  s.quiescence.poll_interval  = 1ms;
  s.cutover.max_attempts      = 3;
  s.cutover.retry_delay       = 1ms;
  s.retry.max_attempts        = 2;
  s.retry.initial_backoff     = 1ms;
  s.retry.max_backoff         = 1ms;
  return s;
}

std::unique_ptr<core::MigrationOrchestrator> Build(const std::shared_ptr<FakeDb>& db, config::Settings settings = FastSettings()) {
  core::Components c;
  c.inspector = std::make_shared<FakeInspector>(db);
  c.registry  = std::make_shared<FakeRegistry>(db);
  c.locker    = std::make_shared<FakeLocker>(db);
  c.capture   = std::make_shared<FakeCapture>(db);
  c.shadows   = std::make_shared<FakeShadows>(db);
  c.copier    = std::make_shared<FakeCopier>(db);
  c.applier   = std::make_shared<FakeApplier>(db);
  c.swapper   = std::make_shared<FakeSwapper>(db);
  return std::make_unique<core::MigrationOrchestrator>(std::move(c), std::move(settings));
}

// Source untouched and every migration artifact gone.
void AssertPristine(FakeDb& db) {
  assert(db.Has(kSource));
  assert(!db.Has(kShadow));
  assert(!db.Has(kLog));
  assert(!db.Has(kArchived));
  assert(!db.HasTriggers(kSource));
  assert(!db.Row().has_value());
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestExecuteSwapsAndCleansUp() {
  auto db     = std::make_shared<FakeDb>();
  db->pending = 30;

  auto       orchestrator = Build(db);
  const auto report       = orchestrator->Migrate(kDdl, RunMode::kExecute);

  assert(report.phase == MigrationPhase::kDone);
  assert(report.Succeeded());
  assert(!report.resumed);
  assert(report.archived == kArchived);
  assert(report.rows_copied == 25);
  assert(report.changes_applied == 30);
  assert(report.replay_watermark == 30);

  assert(db->Has(kSource));
  assert(db->Has(kArchived));
  assert(!db->Has(kShadow));
  assert(!db->Has(kLog));
  assert(!db->HasTriggers(kArchived));
  assert(!db->Row().has_value());
  assert(db->locked.empty());
  assert(db->shadow_creates == 1);
}

void TestRehearsalTearsDownAfterConverging() {
  auto db     = std::make_shared<FakeDb>();
  db->pending = 5;

  const auto report = Build(db)->Migrate(kDdl, RunMode::kRehearsal);
  assert(report.phase == MigrationPhase::kAborted);
  assert(report.abort_reason.empty());
  assert(report.Succeeded());
  assert(report.rows_copied == 25);
  assert(db->swap_calls == 0);
  AssertPristine(*db);
}

void TestReplayOnlyRunsUntilCancelled() {
  auto db     = std::make_shared<FakeDb>();
  db->pending = 12;

  auto        orchestrator = Build(db);
  std::thread canceller([&] {
    std::this_thread::sleep_for(50ms);
    orchestrator->Cancel();
  });
  const auto report = orchestrator->Migrate(kDdl, RunMode::kReplayOnly);
  canceller.join();

  assert(report.phase == MigrationPhase::kAborted);
  assert(report.Succeeded());
  assert(report.rows_copied == 0);
  assert(db->chunk_cursors.empty());
  AssertPristine(*db);
}

void TestInvalidSourcesCreateNothing() {
  {
    auto db            = std::make_shared<FakeDb>();
    db->source_has_key = false;
    assert(Throws<util::ValidationError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    AssertPristine(*db);
    assert(db->shadow_creates == 0);
  }
  {
    auto db = std::make_shared<FakeDb>();
    db->dependents.views.push_back("public.account_totals");
    assert(Throws<util::ValidationError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    AssertPristine(*db);
  }
  {
    auto db = std::make_shared<FakeDb>();
    db->dependents.inbound_foreign_keys.push_back("public.transfers.transfers_account_fkey");
    assert(Throws<util::ValidationError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    AssertPristine(*db);
  }
  {
    auto db = std::make_shared<FakeDb>();
    db->relations.erase(Key(kSource));
    assert(Throws<util::ValidationError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    assert(!db->Row().has_value());
  }
  {
    auto db = std::make_shared<FakeDb>();
    db->relations.insert(Key(kShadow));
    assert(Throws<util::ValidationError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    assert(!db->Row().has_value());
  }
  {
    auto db                = std::make_shared<FakeDb>();
    db->server_version_num = 100014;
    assert(Throws<util::ConfigError>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    AssertPristine(*db);
  }
}

void TestConcurrentMigrationIsRefused() {
  auto db = std::make_shared<FakeDb>();
  db->locked.insert(Key(kSource));

  assert(Throws<util::MigrationConflict>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
  assert(!db->Row().has_value());
  assert(!db->Has(kShadow));
}

void TestCutoverFailureIsTerminalUntilOperatorAbort() {
  auto db   = std::make_shared<FakeDb>();
  db->swaps = {SwapBehavior::kFail};

  auto orchestrator = Build(db);
  assert(Throws<util::CutoverError>([&] { orchestrator->Migrate(kDdl, RunMode::kExecute); }));

  // left for the operator
  const auto row = db->Row();
  assert(row.has_value());
  assert(row->phase == MigrationPhase::kFailed);
  assert(db->Has(kShadow));

  // a plain rerun refuses to touch it
  assert(Throws<util::MigrationConflict>([&] { orchestrator->Migrate(kDdl, RunMode::kExecute); }));

  // the swap rolled back, so abort restores the pre-migration state
  const auto report = orchestrator->Abort(kSource);
  assert(report.phase == MigrationPhase::kAborted);
  assert(!report.Succeeded());
  AssertPristine(*db);
}

void TestLockTimeoutsExhaustedAbort() {
  auto db   = std::make_shared<FakeDb>();
  db->swaps = {SwapBehavior::kTimeout, SwapBehavior::kTimeout, SwapBehavior::kTimeout};

  const auto report = Build(db)->Migrate(kDdl, RunMode::kExecute);
  assert(db->swap_calls == 3);
  assert(report.phase == MigrationPhase::kAborted);
  assert(!report.Succeeded());
  assert(report.abort_reason.find("cutover lock not acquired") != std::string::npos);
  AssertPristine(*db);
}

void TestLockTimeoutThenSwap() {
  auto db   = std::make_shared<FakeDb>();
  db->swaps = {SwapBehavior::kTimeout, SwapBehavior::kSwap};

  const auto report = Build(db)->Migrate(kDdl, RunMode::kExecute);
  assert(db->swap_calls == 2);
  assert(report.phase == MigrationPhase::kDone);
  assert(db->Has(kArchived));
}

void SeedBackfillingMigration(FakeDb& db, const std::string& ddl) {
  model::MigrationRecord r;
  r.source                 = kSource;
  r.shadow                 = kShadow;
  r.log                    = kLog;
  r.target_ddl             = ddl;
  r.phase                  = MigrationPhase::kBackfilling;
  r.mode                   = RunMode::kExecute;
  r.snapshot.taken         = true;
  r.snapshot.max_key       = KeyOf(25);
  r.backfill_cursor        = KeyOf(10);
  r.rows_copied            = 10;
  r.replay_watermark       = 4;
  r.changes_applied        = 4;

  db.registry.emplace(Key(kSource), r);
  db.relations.insert(Key(kShadow));
  db.relations.insert(Key(kLog));
  db.triggers_on.insert(Key(kSource));
  db.seq     = 4;
  db.pending = 3;
}

void TestResumeContinuesFromCursor() {
  auto db = std::make_shared<FakeDb>();
  SeedBackfillingMigration(*db, kDdl);

  const auto report = Build(db)->Migrate(kDdl, RunMode::kExecute);
  assert(report.resumed);
  assert(report.phase == MigrationPhase::kDone);
  assert(db->shadow_creates == 0);
  assert(db->shadow_loads == 1);
  assert(db->chunk_cursors.front() == KeyOf(10));
  assert(report.rows_copied == 25);
  assert(report.changes_applied == 7);
  assert(report.replay_watermark == 7);
}

void TestResumeRefusals() {
  {
    auto db = std::make_shared<FakeDb>();
    SeedBackfillingMigration(*db, "ALTER TABLE public.accounts ADD COLUMN note text;");
    assert(Throws<util::MigrationConflict>([&] { Build(db)->Migrate(kDdl, RunMode::kExecute); }));
    assert(db->Row()->phase == MigrationPhase::kBackfilling);
  }
  {
    auto db = std::make_shared<FakeDb>();
    SeedBackfillingMigration(*db, kDdl);
    assert(Throws<util::MigrationConflict>([&] { Build(db)->Migrate(kDdl, RunMode::kRehearsal); }));
  }
  {
    auto db = std::make_shared<FakeDb>();
    SeedBackfillingMigration(*db, kDdl);
    auto settings             = FastSettings();
    settings.migration.resume = false;
    assert(Throws<util::MigrationConflict>([&] { Build(db, settings)->Migrate(kDdl, RunMode::kExecute); }));
    assert(db->Has(kShadow));
  }
}

void TestOperatorAbortRemovesArtifacts() {
  auto db = std::make_shared<FakeDb>();
  SeedBackfillingMigration(*db, kDdl);

  auto orchestrator = Build(db);
  const auto statuses = orchestrator->Status();
  assert(statuses.size() == 1);
  assert(statuses[0].record.phase == MigrationPhase::kBackfilling);
  assert(statuses[0].backlog == 3u);

  const auto report = orchestrator->Abort(kSource);
  assert(report.phase == MigrationPhase::kAborted);
  assert(report.abort_reason == "operator abort");
  AssertPristine(*db);
  assert(orchestrator->Status().empty());

  assert(Throws<util::ValidationError>([&] { orchestrator->Abort(kSource); }));
}

void TestReplayFailureAbortsTheMigration() {
  auto db          = std::make_shared<FakeDb>();
  db->replay_fails = true;
  db->source_rows  = 200;

  // either the failure surfaces as an error or as an aborted report; both
  // leave the source as it was
  bool aborted = false;
  try {
    const auto report = Build(db)->Migrate(kDdl, RunMode::kExecute);
    aborted           = report.phase == MigrationPhase::kAborted && !report.abort_reason.empty();
  } catch (const std::runtime_error& e) {
    aborted = std::string(e.what()).find("change log row has no key") != std::string::npos;
  }
  assert(aborted);
  assert(db->swap_calls == 0);
  AssertPristine(*db);
}

void TestQuiescenceTimeoutAborts() {
  auto db       = std::make_shared<FakeDb>();
  auto settings = FastSettings();
  settings.quiescence.window   = 200ms;
  settings.quiescence.max_wait = 200ms;

  std::atomic<bool> writing{true};
  std::thread       writer([&] {
    while (writing) {
      {
        std::lock_guard lock(db->mu);
        if (db->relations.count(Key(kLog))) db->pending += 1;
      }
      std::this_thread::sleep_for(100us);
    }
  });

  const auto report = Build(db, settings)->Migrate(kDdl, RunMode::kExecute);
  writing = false;
  writer.join();

  assert(report.phase == MigrationPhase::kAborted);
  assert(report.abort_reason.find("did not settle") != std::string::npos);
  AssertPristine(*db);
}

} // namespace

int main() {
  TestExecuteSwapsAndCleansUp();
  TestRehearsalTearsDownAfterConverging();
  TestReplayOnlyRunsUntilCancelled();
  TestInvalidSourcesCreateNothing();
  TestConcurrentMigrationIsRefused();
  TestCutoverFailureIsTerminalUntilOperatorAbort();
  TestLockTimeoutsExhaustedAbort();
  TestLockTimeoutThenSwap();
  TestResumeContinuesFromCursor();
  TestResumeRefusals();
  TestOperatorAbortRemovesArtifacts();
  TestReplayFailureAbortsTheMigration();
  TestQuiescenceTimeoutAborts();

  std::cout << "pgshadow_unit_migration_orchestrator: pass\n";
  return 0;
}
