#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pgshadow::util {

/*
  Cooperative cancellation flag shared by the orchestrator, the backfill
  loop and the replay worker.

  Loops call IsCancelled() between chunks/batches only; a unit of work that
  already started always runs to commit or rollback.
*/
class Cancellation {
 public:
  void Cancel() {
    {
      std::lock_guard lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  // Sleeps for `duration` unless cancelled first. Returns true if cancelled.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       cancelled_{false};
};

} // namespace pgshadow::util
