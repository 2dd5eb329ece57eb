#pragma once

#include <memory>

#include "change_applier.hpp"
#include "internal/config/settings.hpp"
#include "internal/db/retry_policy.hpp"
#include "internal/util/cancellation.hpp"

namespace pgshadow::replay {

/*
  ReplayEngine

  Drains the change log into the shadow through a ChangeApplier, retrying
  transient failures per batch.
*/
class ReplayEngine {
 public:
  ReplayEngine(std::shared_ptr<ChangeApplier> applier, config::ReplaySettings settings, db::RetryPolicy retry);

  BatchResult DrainOnce(const model::Migration& m, util::Cancellation* cancel);

  // Applies batches until one comes back short. Returns records consumed.
  uint64_t DrainAll(const model::Migration& m, util::Cancellation* cancel);

  uint64_t Backlog(const model::Migration& m);

  const config::ReplaySettings& settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<ChangeApplier> applier_;
  config::ReplaySettings         settings_;
  db::RetryPolicy                retry_;
};

} // namespace pgshadow::replay
