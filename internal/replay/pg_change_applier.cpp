#include "pg_change_applier.hpp"

#include <optional>
#include <vector>

#include "internal/db/postgres/pg_tx.hpp"
#include "internal/registry/registry_sql.hpp"
#include "internal/util/errors.hpp"
#include "replay_planner.hpp"
#include "replay_sql.hpp"

namespace pgshadow::replay {

using db::postgres::PgTransaction;

PgChangeApplier::PgChangeApplier(std::shared_ptr<db::postgres::PgPool> pool, std::string work_schema)
    : pool_(std::move(pool)), work_schema_(std::move(work_schema)) {
}

BatchResult PgChangeApplier::ApplyBatchIn(pqxx::transaction_base& tx, const model::Migration& m, uint32_t batch_size,
                                          const std::string& work_schema) {
  auto rows = tx.exec_params(TakeBatchSql(m), static_cast<int64_t>(batch_size));

  std::vector<model::ChangeRecord> records;
  records.reserve(rows.size());
  for (const auto& row : rows) {
    const auto op_text = row[1].as<std::string>();
    std::optional<model::ChangeOp> op;
    if (!op_text.empty()) {
      op = model::ParseChangeOp(op_text.front());
    }
    if (!op) {
      throw util::ValidationError("change log " + m.log.Display() + " holds unknown op '" + op_text + "'");
    }

    model::ChangeRecord r;
    r.seq = row[0].as<int64_t>();
    r.op  = *op;
    r.key = row[2].as<std::string>();
    if (!row[3].is_null()) {
      r.row_image = row[3].as<std::string>();
    }
    records.push_back(std::move(r));
  }

  const auto plan = PlanBatch(std::move(records));
  if (plan.consumed == 0) {
    return {};
  }

  if (plan.truncate) {
    tx.exec(ClearShadowSql(m));
  }
  if (!plan.delete_keys.empty()) {
    tx.exec_params(DeleteKeysSql(m), JsonArrayOf(plan.delete_keys));
  }
  if (!plan.upsert_images.empty()) {
    const auto images = JsonArrayOf(plan.upsert_images);
    if (m.KeyWidened()) {
      tx.exec_params(DeleteImageKeysSql(m), images);
    }
    tx.exec_params(UpsertImagesSql(m), images);
  }

  tx.exec_params(registry::ReplayProgressSql(work_schema), m.source.schema, m.source.name, plan.max_seq,
                 static_cast<int64_t>(plan.applied()));

  return BatchResult{plan.consumed, plan.applied(), plan.max_seq};
}

BatchResult PgChangeApplier::ApplyBatch(const model::Migration& m, uint32_t batch_size) {
  PgTransaction tx(pool_);
  auto          result = ApplyBatchIn(tx.Work(), m, batch_size, work_schema_);
  tx.Commit();
  return result;
}

uint64_t PgChangeApplier::Backlog(const model::Migration& m) {
  PgTransaction tx(pool_);
  auto          res = tx.Work().exec(BacklogSql(m));
  tx.Commit();
  return res[0][0].as<uint64_t>();
}

} // namespace pgshadow::replay
