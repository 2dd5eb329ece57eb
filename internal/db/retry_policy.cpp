#include "retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace pgshadow::db {

RetryPolicy::RetryPolicy(RetryOptions options) : options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

std::chrono::milliseconds RetryPolicy::BackoffFor(uint32_t attempt) const {
  auto delay = options_.initial_backoff;
  for (uint32_t i = 1; i < attempt && delay < options_.max_backoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_backoff);
}

void RetryPolicy::SleepFor(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

} // namespace pgshadow::db
