#include "pg_swap_coordinator.hpp"

#include <vector>

#include "internal/db/postgres/pg_catalog.hpp"
#include "internal/db/postgres/pg_errors.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/model/naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/registry_sql.hpp"
#include "internal/replay/pg_change_applier.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pgshadow::cutover {

using db::postgres::PgCatalog;
using db::postgres::PgTransaction;

namespace {

// Sequences that belong to a column of `table`: serial ownership ('a') and
// identity ('i').
std::vector<OwnedSequence> OwnedSequences(pqxx::transaction_base& tx, const model::TableName& table) {
  auto res = tx.exec_params("SELECT n.nspname, s.relname, a.attname "
                            "FROM pg_depend d "
                            "JOIN pg_class s ON s.oid = d.objid AND s.relkind = 'S' "
                            "JOIN pg_namespace n ON n.oid = s.relnamespace "
                            "JOIN pg_attribute a ON a.attrelid = d.refobjid AND a.attnum = d.refobjsubid "
                            "WHERE d.classid = 'pg_class'::regclass AND d.refclassid = 'pg_class'::regclass "
                            "  AND d.refobjid = to_regclass($1::text) AND d.deptype IN ('a', 'i');",
                            table.Qualified());

  std::vector<OwnedSequence> out;
  for (const auto& row : res) {
    out.push_back(OwnedSequence{model::TableName{row[0].as<std::string>(), row[1].as<std::string>()}, row[2].as<std::string>()});
  }
  return out;
}

std::string Where(pqxx::transaction_base& tx, pqxx::oid oid) {
  if (oid == 0) {
    return "unknown";
  }
  auto res = tx.exec_params("SELECT n.nspname, c.relname FROM pg_class c JOIN pg_namespace n ON n.oid = c.relnamespace "
                            "WHERE c.oid = $1;",
                            oid);
  if (res.empty()) {
    return "missing";
  }
  return model::TableName{res[0][0].as<std::string>(), res[0][1].as<std::string>()}.Display();
}

} // namespace

PgSwapCoordinator::PgSwapCoordinator(std::shared_ptr<db::postgres::PgPool> pool, SwapOptions options)
    : pool_(std::move(pool)), options_(std::move(options)) {
}

void PgSwapCoordinator::Step(SwapStep step) const {
  PGSHADOW_LOG_DEBUG("cutover step", {observability::StringField("step", ToString(step))});
  if (hook_) {
    hook_(step);
  }
}

model::TableName PgSwapCoordinator::ChooseArchivedName(pqxx::transaction_base& tx, const model::TableName& source) const {
  const auto now = util::Now();
  for (int collision = 0;; ++collision) {
    auto archived = model::ArchivedName(source, options_.archive_schema, now, collision);
    // the name is used in the source schema first, then in the archive
    const model::TableName staged{source.schema, archived.name};
    if (!PgCatalog::RelationExists(tx, archived) && !PgCatalog::RelationExists(tx, staged)) {
      return archived;
    }
  }
}

std::vector<OwnedSequence> PgSwapCoordinator::DetachSequences(pqxx::transaction_base& tx, const model::Migration& m,
                                                              const model::TableName& staged) const {
  std::vector<OwnedSequence> detached;

  for (const auto& owned : OwnedSequences(tx, staged)) {
    const auto mapping = m.column_map.ForSource(owned.column);
    if (!mapping) {
      // the column is gone; the sequence stays with the archived table
      continue;
    }

    // cloned default: the new column keeps drawing from the original sequence,
    // which must stay in the source schema when the archived table leaves
    auto uses = tx.exec_params("SELECT 1 FROM pg_attrdef d "
                               "JOIN pg_attribute a ON a.attrelid = d.adrelid AND a.attnum = d.adnum "
                               "JOIN pg_depend dep ON dep.classid = 'pg_attrdef'::regclass AND dep.objid = d.oid "
                               "WHERE d.adrelid = to_regclass($1::text) AND a.attname = $2 AND dep.refobjid = to_regclass($3::text);",
                               m.shadow.Qualified(), mapping->shadow, owned.sequence.Qualified());
    if (!uses.empty()) {
      tx.exec("ALTER SEQUENCE " + owned.sequence.Qualified() + " OWNED BY NONE;");
      detached.push_back(OwnedSequence{owned.sequence, mapping->shadow});
      continue;
    }

    auto current = tx.exec_params("SELECT pg_get_serial_sequence($1, $2);", m.shadow.Qualified(), mapping->shadow);
    if (current[0][0].is_null()) {
      continue;
    }

    // the new column has its own sequence; continue where the original stopped
    tx.exec_params("SELECT setval($1::regclass, o.last_value, o.is_called) FROM " + owned.sequence.Qualified() + " o;",
                   current[0][0].as<std::string>());
    PGSHADOW_LOG_INFO("sequence position carried over", {observability::TableField("from", owned.sequence),
                                                         observability::StringField("to", current[0][0].as<std::string>())});
  }
  return detached;
}

void PgSwapCoordinator::Archive(pqxx::transaction_base& tx, const model::TableName& staged, const model::TableName& archived) const {
  // index and sequence names are unique per schema; earlier migrations of the
  // same table left objects with the same generated names in the archive
  auto indexes = tx.exec_params("SELECT c.relname FROM pg_index i JOIN pg_class c ON c.oid = i.indexrelid "
                                "WHERE i.indrelid = to_regclass($1::text) ORDER BY c.relname;",
                                staged.Qualified());
  int n = 0;
  for (const auto& row : indexes) {
    const model::TableName index{staged.schema, row[0].as<std::string>()};
    tx.exec("ALTER INDEX " + index.Qualified() + " RENAME TO " +
            model::QuoteIdent(model::FitIdentifier(archived.name, "_idx" + std::to_string(++n))) + ";");
  }

  n = 0;
  for (const auto& owned : OwnedSequences(tx, staged)) {
    tx.exec("ALTER SEQUENCE " + owned.sequence.Qualified() + " RENAME TO " +
            model::QuoteIdent(model::FitIdentifier(archived.name, "_seq" + std::to_string(++n))) + ";");
  }

  tx.exec("ALTER TABLE " + staged.Qualified() + " SET SCHEMA " + model::QuoteIdent(archived.schema) + ";");
}

void PgSwapCoordinator::ReattachSequences(pqxx::transaction_base& tx, const model::Migration& m,
                                          const std::vector<OwnedSequence>& detached) const {
  for (const auto& owned : detached) {
    tx.exec("ALTER SEQUENCE " + owned.sequence.Qualified() + " OWNED BY " + m.source.Qualified() + "." +
            model::QuoteIdent(owned.column) + ";");
    PGSHADOW_LOG_INFO("sequence ownership moved", {observability::TableField("sequence", owned.sequence),
                                                   observability::StringField("column", owned.column)});
  }
}

SwapOutcome PgSwapCoordinator::Swap(const model::Migration& m) {
  SwapOutcome outcome;
  outcome.plan.source = m.source;
  outcome.plan.shadow = m.shadow;

  Oids oids;
  try {
    PgTransaction tx(pool_);
    tx.SetLockTimeout(options_.lock_timeout);
    auto& w = tx.Work();

    auto ids    = w.exec_params("SELECT COALESCE(to_regclass($1::text)::oid, 0), COALESCE(to_regclass($2::text)::oid, 0);",
                                m.source.Qualified(), m.shadow.Qualified());
    oids.source = ids[0][0].as<pqxx::oid>();
    oids.shadow = ids[0][1].as<pqxx::oid>();

    w.exec("LOCK TABLE " + m.source.Qualified() + " IN ACCESS EXCLUSIVE MODE;");
    Step(SwapStep::kLocked);

    // writers are blocked now, so the log only shrinks
    for (;;) {
      const auto batch = replay::PgChangeApplier::ApplyBatchIn(w, m, options_.drain_batch_size, options_.work_schema);
      outcome.drained += batch.consumed;
      if (batch.consumed < options_.drain_batch_size) break;
    }
    Step(SwapStep::kDrained);

    outcome.plan.archived = ChooseArchivedName(w, m.source);
    const model::TableName staged{m.source.schema, outcome.plan.archived.name};

    w.exec("CREATE SCHEMA IF NOT EXISTS " + model::QuoteIdent(options_.archive_schema) + ";");
    w.exec("ALTER TABLE " + m.source.Qualified() + " RENAME TO " + model::QuoteIdent(staged.name) + ";");
    Step(SwapStep::kSourceRenamed);

    const auto detached = DetachSequences(w, m, staged);
    Archive(w, staged, outcome.plan.archived);
    Step(SwapStep::kArchived);

    w.exec("ALTER TABLE " + m.shadow.Qualified() + " SET SCHEMA " + model::QuoteIdent(m.source.schema) + ";");
    w.exec("ALTER TABLE " + model::TableName{m.source.schema, m.shadow.name}.Qualified() + " RENAME TO " +
           model::QuoteIdent(m.source.name) + ";");
    Step(SwapStep::kShadowMoved);

    ReattachSequences(w, m, detached);
    Step(SwapStep::kSequencesRepointed);

    w.exec_params(registry::UpdatePhaseSql(options_.work_schema), m.source.schema, m.source.name,
                  std::string(model::ToString(model::MigrationPhase::kCleanup)));
    Step(SwapStep::kRecorded);

    tx.Commit();
  } catch (const std::exception& e) {
    const auto result = db::postgres::Translate(e);
    if (result.code == db::ErrorCode::LockTimeout) {
      PGSHADOW_LOG_WARN("cutover lock not acquired, swap rolled back",
                        {observability::TableField("table", m.source), observability::StringField("error", result.message)});
      outcome.swapped = false;
      return outcome;
    }

    const auto report = Inspect(outcome.plan, oids);
    PGSHADOW_LOG_ERROR("cutover failed", {observability::TableField("table", m.source),
                                          observability::ErrorField(e),
                                          observability::StringField("report", report)});
    throw util::CutoverError("cutover of " + m.source.Display() + " failed: " + e.what() + "; " + report);
  }

  outcome.swapped = true;
  PGSHADOW_LOG_INFO("cutover committed", {observability::TableField("table", m.source),
                                          observability::TableField("archived", outcome.plan.archived),
                                          observability::IntField("drained", static_cast<int64_t>(outcome.drained))});
  return outcome;
}

std::string PgSwapCoordinator::Inspect(const model::SwapPlan& plan, const Oids& oids) const {
  try {
    PgTransaction tx(pool_);
    auto&         w = tx.Work();

    std::string holder = "nothing";
    auto        res    = w.exec_params("SELECT COALESCE(to_regclass($1::text)::oid, 0);", plan.source.Qualified());
    const auto  owner  = res[0][0].as<pqxx::oid>();
    if (owner != 0) {
      holder = owner == oids.source ? "the original table" : owner == oids.shadow ? "the shadow table" : "another relation";
    }

    std::string report = plan.source.Display() + " is held by " + holder;
    report += "; original table is at " + Where(w, oids.source);
    report += "; shadow table is at " + Where(w, oids.shadow);
    report += "; shadow still in work schema: ";
    report += PgCatalog::RelationExists(w, plan.shadow) ? "yes" : "no";
    if (!plan.archived.name.empty()) {
      report += "; archived table " + plan.archived.Display() + " exists: ";
      report += PgCatalog::RelationExists(w, plan.archived) ? "yes" : "no";
    }
    tx.Commit();
    return report;
  } catch (const std::exception& e) {
    return "catalog inspection failed: " + std::string(e.what());
  }
}

} // namespace pgshadow::cutover
