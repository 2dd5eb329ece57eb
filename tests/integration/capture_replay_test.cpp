#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <pqxx/pqxx>
#include <random>
#include <string>
#include <thread>

#include "internal/backfill/backfill_engine.hpp"
#include "internal/capture/capture_installer.hpp"
#include "internal/catalog/schema_inspector.hpp"
#include "internal/config/settings.hpp"
#include "internal/ddl/target_ddl.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/factory.hpp"
#include "internal/registry/migration_registry.hpp"
#include "internal/replay/replay_engine.hpp"
#include "internal/replay/replay_worker.hpp"
#include "internal/shadow/shadow_table_manager.hpp"

namespace {

using namespace pgshadow;
using namespace std::chrono_literals;

constexpr char kDdl[] = "ALTER TABLE it_capture.items ADD COLUMN note text DEFAULT 'n/a';";

/*
  One pool and the PostgreSQL-backed components, driven by hand instead of
  through the orchestrator so each engine can be observed on its own.
*/
struct Harness {
  std::string                           uri;
  config::Settings                      settings;
  std::shared_ptr<db::postgres::PgPool> pool;
  core::Components                      components;
  model::ArtifactNames                  names;
};

void Exec(const std::string& uri, const std::string& sql) {
  pqxx::connection conn(uri);
  pqxx::work       tx(conn);
  tx.exec(sql);
  tx.commit();
}

int64_t Count(const std::string& uri, const std::string& sql) {
  pqxx::connection conn(uri);
  pqxx::work       tx(conn);
  auto             res = tx.exec(sql);
  tx.commit();
  return res[0][0].as<int64_t>();
}

std::unique_ptr<Harness> MakeHarness(const std::string& uri) {
  auto h                          = std::make_unique<Harness>();
  h->uri                          = uri;
  h->settings.database.connection_uri = uri;
  h->settings.database.max_connections = 6;
  h->settings.migration.work_schema    = "pgshadow_it_cr";
  h->settings.migration.archive_schema = "pgshadow_it_cr_archive";
  h->settings.backfill.chunk_size      = 100;
  h->settings.replay.batch_size        = 50;
  h->settings.replay.poll_interval     = 5ms;

  Exec(uri, "DROP SCHEMA IF EXISTS it_capture CASCADE;"
            "DROP SCHEMA IF EXISTS pgshadow_it_cr CASCADE;"
            "DROP SCHEMA IF EXISTS pgshadow_it_cr_archive CASCADE;"
            "CREATE SCHEMA it_capture;"
            "CREATE TABLE it_capture.items (id bigint PRIMARY KEY, name text NOT NULL, qty integer NOT NULL);");

  h->pool       = std::make_shared<db::postgres::PgPool>(uri, h->settings.database.max_connections, "pgshadow_it");
  h->components = factory::BuildComponents(h->pool, h->settings);
  return h;
}

void Seed(Harness& h, int rows) {
  Exec(h.uri, "INSERT INTO it_capture.items (id, name, qty) "
              "SELECT g, 'item-' || g, g % 17 FROM generate_series(1, " + std::to_string(rows) + ") g;");
}

// Registers the migration, builds the shadow and installs capture, the way
// the orchestrator does on Init.
model::Migration Prepare(Harness& h) {
  auto&      c   = h.components;
  const auto ddl = ddl::TargetDdl::Parse(kDdl);

  model::Migration m;
  m.source            = ddl.source();
  h.names             = model::DeriveArtifactNames(m.source, h.settings.migration.work_schema);
  m.shadow            = h.names.shadow;
  m.log               = h.names.log;
  m.target_ddl        = kDdl;
  m.shadow_statements = ddl.RetargetTo(m.shadow);

  const auto info = c.inspector->DescribeTable(m.source);
  assert(info.has_value());
  m.primary_key = info->primary_key;

  c.registry->EnsureSchema();
  c.registry->Insert(model::ToRecord(m));

  const shadow::ShadowSpec spec{m.source, m.shadow, m.shadow_statements, false, {}};
  const auto               layout = c.shadows->Create(spec, *info);
  m.column_map                    = layout.column_map;
  m.shadow_key                    = layout.shadow_key;
  m.conflict_key                  = layout.conflict_key;

  c.capture->Install(m.source, m.primary_key, h.names);
  return m;
}

void Teardown(Harness& h, const model::Migration& m) {
  h.components.capture->Uninstall(m.source, h.names);
  h.components.capture->DropLog(h.names);
  h.components.shadows->Drop(m.shadow);
  h.components.registry->Remove(m.source);
  Exec(h.uri, "DROP SCHEMA IF EXISTS it_capture CASCADE;"
              "DROP SCHEMA IF EXISTS pgshadow_it_cr CASCADE;");
}

// Rows that differ between source and shadow over the columns they share.
int64_t Divergence(Harness& h, const model::Migration& m) {
  const auto src = m.source.Qualified();
  const auto shd = m.shadow.Qualified();
  return Count(h.uri, "SELECT count(*) FROM ("
                      "(SELECT id, name, qty FROM " + src + " EXCEPT ALL SELECT id, name, qty FROM " + shd + ") "
                      "UNION ALL "
                      "(SELECT id, name, qty FROM " + shd + " EXCEPT ALL SELECT id, name, qty FROM " + src + ")) d;");
}

void Backfill(Harness& h, model::Migration& m) {
  m.snapshot = h.components.copier->TakeSnapshot(m);
  h.components.registry->SaveSnapshot(m.source, m.snapshot);

  backfill::BackfillEngine engine(h.components.copier, h.settings.backfill, db::RetryPolicy(h.settings.retry));
  util::Cancellation       cancel;
  const bool               done = engine.Run(m, cancel);
  assert(done);
}

std::shared_ptr<replay::ReplayEngine> ReplayEngineFor(Harness& h) {
  return std::make_shared<replay::ReplayEngine>(h.components.applier, h.settings.replay, db::RetryPolicy(h.settings.retry));
}

void TestCaptureRecordsEveryMutation(const std::string& uri) {
  auto h = MakeHarness(uri);
  Seed(*h, 3);
  auto m = Prepare(*h);

  // rows seeded before capture are not logged
  assert(Count(uri, "SELECT count(*) FROM " + m.log.Qualified()) == 0);

  Exec(uri, "INSERT INTO it_capture.items VALUES (4, 'four', 4);"
            "UPDATE it_capture.items SET qty = 100 WHERE id = 1;"
            "UPDATE it_capture.items SET id = 20 WHERE id = 2;"
            "DELETE FROM it_capture.items WHERE id = 3;"
            "UPDATE it_capture.items SET qty = qty WHERE id = 999;");

  pqxx::connection conn(uri);
  pqxx::work       tx(conn);
  auto             ops = tx.exec("SELECT string_agg(op::text, '' ORDER BY seq), string_agg(k1::text, ',' ORDER BY seq) FROM " +
                                 m.log.Qualified() + ";");
  // a key change is a delete of the old key followed by an update of the new one
  assert(ops[0][0].as<std::string>() == "IUDUD");
  assert(ops[0][1].as<std::string>() == "4,1,2,20,3");

  auto image = tx.exec("SELECT row_image ->> 'qty' FROM " + m.log.Qualified() + " WHERE k1 = 1;");
  assert(image[0][0].as<std::string>() == "100");
  tx.commit();

  Exec(uri, "TRUNCATE it_capture.items;");
  assert(Count(uri, "SELECT count(*) FROM " + m.log.Qualified() + " WHERE op = 'T' AND k1 IS NULL") == 1);

  // re-installing keeps exactly one set of triggers
  h->components.capture->Install(m.source, m.primary_key, h->names);
  assert(Count(uri, "SELECT count(*) FROM pg_trigger WHERE tgrelid = 'it_capture.items'::regclass AND NOT tgisinternal") == 4);

  Teardown(*h, m);
}

void TestReplayConvergesAndIsIdempotent(const std::string& uri) {
  auto h = MakeHarness(uri);
  Seed(*h, 300);
  auto m = Prepare(*h);

  m.snapshot = h->components.copier->TakeSnapshot(m);
  h->components.registry->SaveSnapshot(m.source, m.snapshot);

  // changes after the snapshot but before the chunks reach them
  Exec(uri, "UPDATE it_capture.items SET qty = qty + 1000 WHERE id % 10 = 0;"
            "DELETE FROM it_capture.items WHERE id BETWEEN 100 AND 120;"
            "INSERT INTO it_capture.items SELECT g, 'late-' || g, 1 FROM generate_series(301, 320) g;"
            "UPDATE it_capture.items SET id = id + 10000 WHERE id IN (5, 6, 7);");

  Exec(uri, "CREATE TABLE pgshadow_it_cr.stash AS SELECT * FROM " + m.log.Qualified() + ";");

  backfill::BackfillEngine engine(h->components.copier, h->settings.backfill, db::RetryPolicy(h->settings.retry));
  util::Cancellation       cancel;
  assert(engine.Run(m, cancel));

  auto replay = ReplayEngineFor(*h);
  replay->DrainAll(m, nullptr);
  assert(replay->Backlog(m) == 0);
  assert(Divergence(*h, m) == 0);
  assert(Count(uri, "SELECT count(*) FROM " + m.shadow.Qualified() + " WHERE note = 'n/a'") ==
         Count(uri, "SELECT count(*) FROM it_capture.items"));

  // the same changes a second time leave the shadow as it is
  Exec(uri, "INSERT INTO " + m.log.Qualified() + " (op, k1, row_image) SELECT op, k1, row_image FROM pgshadow_it_cr.stash ORDER BY seq;");
  assert(replay->Backlog(m) > 0);
  replay->DrainAll(m, nullptr);
  assert(Divergence(*h, m) == 0);

  // truncate empties the shadow, later inserts survive it
  Exec(uri, "TRUNCATE it_capture.items; INSERT INTO it_capture.items VALUES (1, 'again', 1);");
  replay->DrainAll(m, nullptr);
  assert(Count(uri, "SELECT count(*) FROM " + m.shadow.Qualified()) == 1);
  assert(Divergence(*h, m) == 0);

  const auto row = h->components.registry->Find(m.source);
  assert(row.has_value());
  assert(row->backfill_complete);
  assert(row->replay_watermark > 0);

  Teardown(*h, m);
}

void TestBackfillRacesWithWriters(const std::string& uri) {
  auto h = MakeHarness(uri);
  Seed(*h, 3000);
  auto m = Prepare(*h);

  auto                 replay = ReplayEngineFor(*h);
  replay::ReplayWorker worker(replay, m);
  worker.Start();

  std::atomic<bool> writing{true};
  std::thread       writer([&] {
    pqxx::connection             conn(uri);
    std::mt19937                 rng(42);
    std::uniform_int_distribution<int> pick(1, 3000);
    int64_t                      next_id = 100000;

    while (writing) {
      const auto id = std::to_string(pick(rng));
      pqxx::work tx(conn);
      switch (rng() % 4) {
        case 0:
          tx.exec("UPDATE it_capture.items SET qty = qty + 1, name = name || '+' WHERE id = " + id + ";");
          break;
        case 1:
          tx.exec("DELETE FROM it_capture.items WHERE id = " + id + ";");
          break;
        case 2:
          tx.exec("INSERT INTO it_capture.items VALUES (" + std::to_string(next_id++) + ", 'new', 0);");
          break;
        default:
          tx.exec("UPDATE it_capture.items SET id = " + std::to_string(next_id++) + " WHERE id = " + id + ";");
          break;
      }
      tx.commit();
    }
  });

  Backfill(*h, m);
  std::this_thread::sleep_for(200ms);
  writing = false;
  writer.join();

  worker.Stop();
  assert(!worker.failure().has_value());
  replay->DrainAll(m, nullptr);

  assert(Divergence(*h, m) == 0);
  assert(Count(uri, "SELECT count(*) FROM " + m.shadow.Qualified()) == Count(uri, "SELECT count(*) FROM it_capture.items"));

  Teardown(*h, m);
}

} // namespace

int main() {
  const char* uri = std::getenv("PGSHADOW_TEST_POSTGRES_URI");
  if (uri == nullptr || *uri == '\0') {
    std::cout << "pgshadow_integration_capture_replay: skipped (PGSHADOW_TEST_POSTGRES_URI is not set)\n";
    return 0;
  }

  TestCaptureRecordsEveryMutation(uri);
  TestReplayConvergesAndIsIdempotent(uri);
  TestBackfillRacesWithWriters(uri);

  std::cout << "pgshadow_integration_capture_replay: pass\n";
  return 0;
}
