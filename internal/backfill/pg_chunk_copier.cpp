#include "pg_chunk_copier.hpp"

#include "backfill_sql.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/registry/registry_sql.hpp"

namespace pgshadow::backfill {

using db::postgres::PgTransaction;

PgChunkCopier::PgChunkCopier(std::shared_ptr<db::postgres::PgPool> pool, std::string work_schema)
    : pool_(std::move(pool)), work_schema_(std::move(work_schema)) {
}

model::Snapshot PgChunkCopier::TakeSnapshot(const model::Migration& m) {
  PgTransaction tx(pool_);
  auto          res = tx.Work().exec(SnapshotSql(m));
  tx.Commit();

  model::Snapshot snap;
  snap.taken   = true;
  snap.log_seq = res[0][0].as<int64_t>();
  if (!res[0][1].is_null()) {
    snap.max_key = res[0][1].as<std::string>();
  }
  return snap;
}

ChunkResult PgChunkCopier::CopyChunk(const model::Migration& m, const std::optional<std::string>& cursor, uint32_t limit) {
  PgTransaction tx(pool_);
  auto&         w = tx.Work();

  const auto sql = CopyChunkSql(m, cursor.has_value());
  pqxx::result res;
  if (cursor) {
    res = w.exec_params(sql, m.snapshot.max_key, m.snapshot.log_seq, static_cast<int64_t>(limit), *cursor);
  } else {
    res = w.exec_params(sql, m.snapshot.max_key, m.snapshot.log_seq, static_cast<int64_t>(limit));
  }

  ChunkResult out;
  out.scanned = res[0][0].as<uint64_t>();
  out.copied  = res[0][1].as<uint64_t>();
  if (!res[0][2].is_null()) {
    out.last_key = res[0][2].as<std::string>();
  }

  const bool done = out.scanned < limit;
  w.exec_params(registry::BackfillProgressSql(work_schema_), m.source.schema, m.source.name, out.last_key,
                static_cast<int64_t>(out.copied), done);
  tx.Commit();
  return out;
}

} // namespace pgshadow::backfill
