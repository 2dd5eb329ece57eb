#include "replay_engine.hpp"

namespace pgshadow::replay {

ReplayEngine::ReplayEngine(std::shared_ptr<ChangeApplier> applier, config::ReplaySettings settings, db::RetryPolicy retry)
    : applier_(std::move(applier)), settings_(settings), retry_(std::move(retry)) {
}

BatchResult ReplayEngine::DrainOnce(const model::Migration& m, util::Cancellation* cancel) {
  return retry_.Run("replay batch", cancel, [&] { return applier_->ApplyBatch(m, settings_.batch_size); });
}

uint64_t ReplayEngine::DrainAll(const model::Migration& m, util::Cancellation* cancel) {
  uint64_t total = 0;
  for (;;) {
    const auto batch = DrainOnce(m, cancel);
    total += batch.consumed;
    if (batch.consumed < settings_.batch_size) {
      return total;
    }
  }
}

uint64_t ReplayEngine::Backlog(const model::Migration& m) {
  return retry_.Run("measure backlog", nullptr, [&] { return applier_->Backlog(m); });
}

} // namespace pgshadow::replay
