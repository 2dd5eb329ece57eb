#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include <string_view>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace pgshadow::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  // SET LOCAL lock_timeout; only this transaction is affected.
  void SetLockTimeout(std::chrono::milliseconds timeout);

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool finished_ = false;
};

}
