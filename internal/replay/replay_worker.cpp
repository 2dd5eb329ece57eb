#include "replay_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pgshadow::replay {

ReplayWorker::ReplayWorker(std::shared_ptr<ReplayEngine> engine, model::Migration migration, std::function<void()> on_failure)
    : engine_(std::move(engine)), migration_(std::move(migration)), on_failure_(std::move(on_failure)) {
  watermark_ = migration_.replay_watermark;
}

ReplayWorker::~ReplayWorker() {
  Stop();
}

void ReplayWorker::Start() {
  running_ = true;
  thread_  = std::thread(&ReplayWorker::Run, this);
}

void ReplayWorker::Stop() {
  stop_.Cancel();
  if (thread_.joinable())
    thread_.join();
  running_ = false;
}

std::optional<std::string> ReplayWorker::failure() const {
  std::lock_guard lock(failure_mutex_);
  return failure_;
}

void ReplayWorker::Run() {
  const auto& settings = engine_->settings();

  PGSHADOW_LOG_INFO("replay worker started", {observability::TableField("table", migration_.source),
                                              observability::IntField("watermark", watermark_)});

  while (!stop_.IsCancelled()) {
    try {
      const auto batch = engine_->DrainOnce(migration_, &stop_);
      consumed_ += batch.consumed;
      applied_ += batch.applied;
      if (batch.max_seq > watermark_) {
        watermark_ = batch.max_seq;
      }

      if (batch.consumed > 0) {
        PGSHADOW_LOG_DEBUG("replay batch committed", {observability::TableField("table", migration_.source),
                                                      observability::IntField("consumed", static_cast<int64_t>(batch.consumed)),
                                                      observability::IntField("applied", static_cast<int64_t>(batch.applied)),
                                                      observability::IntField("watermark", watermark_)});
      }

      if (batch.consumed < settings.batch_size) {
        stop_.WaitFor(settings.poll_interval);
      }
    } catch (const util::Cancelled&) {
      break;
    } catch (const std::exception& e) {
      PGSHADOW_LOG_ERROR("replay worker failed", {observability::TableField("table", migration_.source),
                                                  observability::IntField("watermark", watermark_),
                                                  observability::ErrorField(e)});
      {
        std::lock_guard lock(failure_mutex_);
        failure_ = e.what();
      }
      if (on_failure_) {
        on_failure_();
      }
      break;
    }
  }

  running_ = false;
  PGSHADOW_LOG_INFO("replay worker stopped", {observability::TableField("table", migration_.source),
                                              observability::IntField("watermark", watermark_),
                                              observability::IntField("consumed", static_cast<int64_t>(consumed_.load()))});
}

} // namespace pgshadow::replay
