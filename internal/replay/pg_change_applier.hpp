#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "change_applier.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace pgshadow::replay {

class PgChangeApplier final : public ChangeApplier {
 public:
  PgChangeApplier(std::shared_ptr<db::postgres::PgPool> pool, std::string work_schema);

  BatchResult ApplyBatch(const model::Migration& m, uint32_t batch_size) override;
  uint64_t    Backlog(const model::Migration& m) override;

  // The batch body, for callers that already hold a transaction (cutover).
  static BatchResult ApplyBatchIn(pqxx::transaction_base& tx, const model::Migration& m, uint32_t batch_size,
                                  const std::string& work_schema);

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  std::string                           work_schema_;
};

} // namespace pgshadow::replay
