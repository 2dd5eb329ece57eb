#pragma once

#include <memory>
#include <string>

#include "chunk_copier.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace pgshadow::backfill {

class PgChunkCopier final : public ChunkCopier {
 public:
  PgChunkCopier(std::shared_ptr<db::postgres::PgPool> pool, std::string work_schema);

  model::Snapshot TakeSnapshot(const model::Migration& m) override;
  ChunkResult     CopyChunk(const model::Migration& m, const std::optional<std::string>& cursor, uint32_t limit) override;

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  std::string                           work_schema_;
};

} // namespace pgshadow::backfill
