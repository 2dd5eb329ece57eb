#pragma once

#include <memory>

#include "chunk_copier.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/retry_policy.hpp"
#include "internal/util/cancellation.hpp"

namespace pgshadow::backfill {

/*
  BackfillEngine

  Copies source rows into the shadow in key order, one chunk per
  transaction, starting after m.backfill_cursor. Runs on the orchestrator
  thread while the replay worker drains the log concurrently.

  Completion: a chunk that scans fewer rows than the chunk size. The
  snapshot must have been taken.
*/
class BackfillEngine {
 public:
  BackfillEngine(std::shared_ptr<ChunkCopier> copier, config::BackfillSettings settings, db::RetryPolicy retry);

  // Returns true when complete, false when cancelled between chunks.
  bool Run(model::Migration& m, util::Cancellation& cancel);

 private:
  std::shared_ptr<ChunkCopier> copier_;
  config::BackfillSettings     settings_;
  db::RetryPolicy              retry_;
};

} // namespace pgshadow::backfill
