#include "trigger_capture_installer.hpp"

#include "capture_sql.hpp"
#include "internal/db/postgres/pg_catalog.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/observability/logging.hpp"

namespace pgshadow::capture {

using db::postgres::PgTransaction;

TriggerCaptureInstaller::TriggerCaptureInstaller(std::shared_ptr<db::postgres::PgPool> pool, db::RetryPolicy retry,
                                                 std::chrono::milliseconds lock_timeout)
    : pool_(std::move(pool)), retry_(std::move(retry)), lock_timeout_(lock_timeout) {
}

void TriggerCaptureInstaller::Install(const model::TableName& source, const model::PrimaryKey& key,
                                      const model::ArtifactNames& names) {
  retry_.Run("install capture", nullptr, [&] {
    PgTransaction tx(pool_);
    // CREATE TRIGGER queues behind long readers; fail fast and retry instead
    tx.SetLockTimeout(lock_timeout_);

    auto& w = tx.Work();
    w.exec(CreateLogTableSql(names, key));
    w.exec(CreateRowFunctionSql(names, key));
    w.exec(CreateTruncateFunctionSql(names));
    w.exec(CreateTriggersSql(source, names));
    tx.Commit();
  });

  PGSHADOW_LOG_INFO("capture installed", {observability::TableField("table", source),
                                          observability::TableField("log", names.log)});
}

void TriggerCaptureInstaller::Uninstall(const model::TableName& triggers_on, const model::ArtifactNames& names) {
  retry_.Run("uninstall capture", nullptr, [&] {
    PgTransaction tx(pool_);
    tx.SetLockTimeout(lock_timeout_);

    auto& w = tx.Work();
    if (db::postgres::PgCatalog::RelationExists(w, triggers_on)) {
      w.exec(DropTriggersSql(triggers_on));
    }
    w.exec(DropFunctionsSql(names));
    tx.Commit();
  });

  PGSHADOW_LOG_INFO("capture removed", {observability::TableField("table", triggers_on)});
}

void TriggerCaptureInstaller::DropLog(const model::ArtifactNames& names) {
  retry_.Run("drop change log", nullptr, [&] {
    PgTransaction tx(pool_);
    tx.Work().exec(DropLogSql(names));
    tx.Commit();
  });
}

} // namespace pgshadow::capture
