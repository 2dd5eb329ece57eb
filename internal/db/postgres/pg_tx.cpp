#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace pgshadow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      PGSHADOW_LOG_WARN("rollback on release failed", {observability::ErrorField(e)});
    }
  }
}

void PgTransaction::SetLockTimeout(std::chrono::milliseconds timeout) {
  tx_->exec("SET LOCAL lock_timeout = '" + std::to_string(timeout.count()) + "ms'");
}

void PgTransaction::Commit() {
  finished_ = true;
  tx_->commit();
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
