#include "settings.hpp"

#include "internal/model/table_name.hpp"
#include "internal/util/errors.hpp"

namespace pgshadow::config {

namespace {

template <typename T, typename U>
T OrDefault(U value, T fallback) {
  return value == 0 ? fallback : static_cast<T>(value);
}

std::chrono::milliseconds MillisOr(uint32_t value, std::chrono::milliseconds fallback) {
  return value == 0 ? fallback : std::chrono::milliseconds(value);
}

void RequireSchemaName(const std::string& field, const std::string& value) {
  if (value.empty() || value.size() > model::kMaxIdentifierLength) {
    throw util::ConfigError(field + " must be a non-empty identifier of at most 63 bytes");
  }
}

} // namespace

Settings ResolveSettings(const pgshadow::runtime::config::RuntimeConfig& config) {
  Settings s;

  const auto& db          = config.database();
  s.database.connection_uri   = db.connection_uri();
  s.database.max_connections  = OrDefault<std::size_t>(db.max_connections(), s.database.max_connections);
  if (!db.application_name().empty()) {
    s.database.application_name = db.application_name();
  }
  // orchestrator, backfill and replay each hold one connection at a time
  if (s.database.max_connections < 3) {
    throw util::ConfigError("database.max_connections must be at least 3");
  }

  const auto& mig = config.migration();
  if (!mig.work_schema().empty()) {
    s.migration.work_schema = mig.work_schema();
  }
  if (!mig.archive_schema().empty()) {
    s.migration.archive_schema = mig.archive_schema();
  }
  if (mig.has_resume()) {
    s.migration.resume = mig.resume();
  }
  RequireSchemaName("migration.work_schema", s.migration.work_schema);
  RequireSchemaName("migration.archive_schema", s.migration.archive_schema);
  if (s.migration.work_schema == s.migration.archive_schema) {
    throw util::ConfigError("migration.work_schema and migration.archive_schema must differ");
  }

  const auto& bf       = config.backfill();
  s.backfill.chunk_size = OrDefault<uint32_t>(bf.chunk_size(), s.backfill.chunk_size);
  s.backfill.pause = std::chrono::milliseconds(bf.pause_ms());

  const auto& rp          = config.replay();
  s.replay.batch_size     = OrDefault<uint32_t>(rp.batch_size(), s.replay.batch_size);
  s.replay.poll_interval  = MillisOr(rp.poll_interval_ms(), s.replay.poll_interval);

  const auto& q             = config.quiescence();
  s.quiescence.window        = MillisOr(q.window_ms(), s.quiescence.window);
  s.quiescence.poll_interval = MillisOr(q.poll_interval_ms(), s.quiescence.poll_interval);
  s.quiescence.max_wait      = std::chrono::milliseconds(q.max_wait_ms());
  if (s.quiescence.max_wait.count() != 0 && s.quiescence.max_wait < s.quiescence.window) {
    throw util::ConfigError("quiescence.max_wait_ms must be 0 or at least quiescence.window_ms");
  }

  const auto& co          = config.cutover();
  s.cutover.lock_timeout  = MillisOr(co.lock_timeout_ms(), s.cutover.lock_timeout);
  s.cutover.max_attempts  = OrDefault<uint32_t>(co.max_attempts(), s.cutover.max_attempts);
  s.cutover.retry_delay   = MillisOr(co.retry_delay_ms(), s.cutover.retry_delay);

  const auto& rt           = config.retry();
  s.retry.max_attempts     = OrDefault<uint32_t>(rt.max_attempts(), s.retry.max_attempts);
  s.retry.initial_backoff  = MillisOr(rt.initial_backoff_ms(), s.retry.initial_backoff);
  s.retry.max_backoff      = MillisOr(rt.max_backoff_ms(), s.retry.max_backoff);
  if (s.retry.max_backoff < s.retry.initial_backoff) {
    throw util::ConfigError("retry.max_backoff_ms must be >= retry.initial_backoff_ms");
  }

  return s;
}

} // namespace pgshadow::config
