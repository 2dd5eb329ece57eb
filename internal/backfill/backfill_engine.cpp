#include "backfill_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace pgshadow::backfill {

BackfillEngine::BackfillEngine(std::shared_ptr<ChunkCopier> copier, config::BackfillSettings settings, db::RetryPolicy retry)
    : copier_(std::move(copier)), settings_(settings), retry_(std::move(retry)) {
}

bool BackfillEngine::Run(model::Migration& m, util::Cancellation& cancel) {
  if (!m.snapshot.taken) {
    throw std::logic_error("backfill of " + m.source.Display() + " started without a snapshot");
  }

  uint64_t chunks = 0;
  while (!m.backfill_complete) {
    if (cancel.IsCancelled()) {
      PGSHADOW_LOG_INFO("backfill interrupted", {observability::TableField("table", m.source),
                                                 observability::StringField("cursor", m.backfill_cursor.value_or("")),
                                                 observability::IntField("rows_copied", static_cast<int64_t>(m.rows_copied))});
      return false;
    }

    const auto result =
        retry_.Run("backfill chunk", &cancel, [&] { return copier_->CopyChunk(m, m.backfill_cursor, settings_.chunk_size); });

    ++chunks;
    if (result.last_key) {
      m.backfill_cursor = result.last_key;
    }
    m.rows_copied += result.copied;
    m.backfill_complete = result.scanned < settings_.chunk_size;

    PGSHADOW_LOG_DEBUG("backfill chunk committed",
                       {observability::TableField("table", m.source),
                        observability::IntField("scanned", static_cast<int64_t>(result.scanned)),
                        observability::IntField("copied", static_cast<int64_t>(result.copied)),
                        observability::StringField("cursor", m.backfill_cursor.value_or(""))});

    if (!m.backfill_complete && settings_.pause.count() > 0) {
      // a cancel during the pause is seen at the top of the loop
      cancel.WaitFor(settings_.pause);
    }
  }

  PGSHADOW_LOG_INFO("backfill complete", {observability::TableField("table", m.source),
                                          observability::IntField("rows_copied", static_cast<int64_t>(m.rows_copied)),
                                          observability::IntField("chunks", static_cast<int64_t>(chunks))});
  return true;
}

} // namespace pgshadow::backfill
