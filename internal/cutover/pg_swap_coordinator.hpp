#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/postgres/pg_pool.hpp"
#include "swap_coordinator.hpp"

namespace pgshadow::cutover {

// A sequence owned by (or drawn from by) one column.
struct OwnedSequence {
  model::TableName sequence;
  std::string      column;
};

struct SwapOptions {
  std::string               work_schema;
  std::string               archive_schema;
  std::chrono::milliseconds lock_timeout{2000};
  uint32_t                  drain_batch_size = 500;
};

/*
  PgSwapCoordinator

  Inside one transaction:
    1. SET LOCAL lock_timeout; LOCK source IN ACCESS EXCLUSIVE MODE
    2. drain the change log into the shadow
    3. rename source to its archived name (still in the source schema)
    4. detach serial sequences the new table keeps drawing from, then move
       the archived table (with its renamed indexes) into the archive schema
    5. move the shadow into the source schema, rename it to the source name
    6. attach the detached sequences to the new table
    7. mark the registry row 'cleanup'
  The archived table leaves the source schema before the shadow enters it,
  so generated index names of both never meet in one schema.
*/
class PgSwapCoordinator final : public SwapCoordinator {
 public:
  PgSwapCoordinator(std::shared_ptr<db::postgres::PgPool> pool, SwapOptions options);

  SwapOutcome Swap(const model::Migration& m) override;

  void SetStepHook(StepHook hook) override {
    hook_ = std::move(hook);
  }

 private:
  struct Oids {
    pqxx::oid source = 0;
    pqxx::oid shadow = 0;
  };

  model::TableName ChooseArchivedName(pqxx::transaction_base& tx, const model::TableName& source) const;
  std::vector<OwnedSequence> DetachSequences(pqxx::transaction_base& tx, const model::Migration& m,
                                             const model::TableName& staged) const;
  void Archive(pqxx::transaction_base& tx, const model::TableName& staged, const model::TableName& archived) const;
  void ReattachSequences(pqxx::transaction_base& tx, const model::Migration& m, const std::vector<OwnedSequence>& detached) const;
  std::string      Inspect(const model::SwapPlan& plan, const Oids& oids) const;
  void             Step(SwapStep step) const;

  std::shared_ptr<db::postgres::PgPool> pool_;
  SwapOptions                           options_;
  StepHook                              hook_;
};

} // namespace pgshadow::cutover
