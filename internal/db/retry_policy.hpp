#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/db/postgres/pg_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace pgshadow::db {

struct RetryOptions {
  uint32_t                  max_attempts    = 8;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(100);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(5000);
};

/*
  RetryPolicy

  Re-runs one unit of work (a backfill chunk, a replay batch, a capture
  install) while it fails with a transient code. The unit must be a single
  transaction: a failed attempt has rolled back entirely, so re-running it
  is safe.

  Non-transient failures propagate unchanged. A transient failure that
  exhausts the budget becomes util::TransientError.
*/
class RetryPolicy {
 public:
  explicit RetryPolicy(RetryOptions options = {});

  // Delay before retry number `attempt` (1-based), doubling and capped.
  std::chrono::milliseconds BackoffFor(uint32_t attempt) const;

  const RetryOptions& options() const {
    return options_;
  }

  template <typename Fn>
  auto Run(std::string_view what, util::Cancellation* cancel, Fn&& fn) const -> decltype(fn()) {
    for (uint32_t attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const std::exception& e) {
        const auto result = postgres::Translate(e);
        if (!db::IsTransient(result.code)) {
          throw;
        }
        if (attempt >= options_.max_attempts) {
          throw util::TransientError(std::string(what) + " failed after " + std::to_string(attempt) + " attempts: " + result.message);
        }

        const auto delay = BackoffFor(attempt);
        PGSHADOW_LOG_WARN("transient failure, retrying",
                          {observability::StringField("unit", what), observability::StringField("code", ToString(result.code)),
                           observability::IntField("attempt", attempt), observability::IntField("backoff_ms", delay.count()),
                           observability::StringField("error", result.message)});

        bool cancelled = false;
        if (cancel != nullptr) {
          cancelled = cancel->WaitFor(delay);
        } else {
          SleepFor(delay);
        }
        if (cancelled) {
          throw util::Cancelled(std::string(what) + " cancelled while backing off");
        }
      }
    }
  }

 private:
  static void SleepFor(std::chrono::milliseconds delay);

  RetryOptions options_;
};

} // namespace pgshadow::db
