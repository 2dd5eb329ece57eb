#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "replay_engine.hpp"

namespace pgshadow::replay {

/*
  Background worker that keeps the shadow converging while backfill runs.

  Loop: apply a batch; sleep poll_interval when the batch came back short.
  Stop() is honoured between batches only, so an in-flight batch always
  commits or rolls back before the thread exits.

  A non-transient failure ends the loop, is reported through failure() and
  fires on_failure so the orchestrator can stop the backfill and abort.
*/
class ReplayWorker {
 public:
  ReplayWorker(std::shared_ptr<ReplayEngine> engine, model::Migration migration, std::function<void()> on_failure = {});
  ~ReplayWorker();

  void Start();
  void Stop();

  bool running() const {
    return running_;
  }

  std::optional<std::string> failure() const;

  int64_t watermark() const {
    return watermark_;
  }

  uint64_t consumed() const {
    return consumed_;
  }

  uint64_t applied() const {
    return applied_;
  }

 private:
  void Run();

  std::shared_ptr<ReplayEngine> engine_;
  model::Migration              migration_;
  std::function<void()>         on_failure_;

  util::Cancellation    stop_;
  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<int64_t>  watermark_{0};
  std::atomic<uint64_t> consumed_{0};
  std::atomic<uint64_t> applied_{0};

  mutable std::mutex         failure_mutex_;
  std::optional<std::string> failure_;
};

} // namespace pgshadow::replay
