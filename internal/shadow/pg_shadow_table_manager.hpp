#pragma once

#include <chrono>
#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "shadow_table_manager.hpp"

namespace pgshadow::shadow {

class PgShadowTableManager final : public ShadowTableManager {
 public:
  PgShadowTableManager(std::shared_ptr<db::postgres::PgPool> pool, std::chrono::milliseconds lock_timeout);

  ShadowLayout Create(const ShadowSpec& spec, const catalog::TableInfo& source) override;
  ShadowLayout Load(const ShadowSpec& spec, const catalog::TableInfo& source) override;
  bool         Exists(const model::TableName& shadow) override;
  void         Drop(const model::TableName& shadow) override;

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  std::chrono::milliseconds             lock_timeout_;
};

} // namespace pgshadow::shadow
