#pragma once

#include <chrono>
#include <memory>

#include "capture_installer.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/retry_policy.hpp"

namespace pgshadow::capture {

class TriggerCaptureInstaller final : public CaptureInstaller {
 public:
  TriggerCaptureInstaller(std::shared_ptr<db::postgres::PgPool> pool, db::RetryPolicy retry,
                          std::chrono::milliseconds lock_timeout);

  void Install(const model::TableName& source, const model::PrimaryKey& key, const model::ArtifactNames& names) override;
  void Uninstall(const model::TableName& triggers_on, const model::ArtifactNames& names) override;
  void DropLog(const model::ArtifactNames& names) override;

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  db::RetryPolicy                       retry_;
  std::chrono::milliseconds             lock_timeout_;
};

} // namespace pgshadow::capture
