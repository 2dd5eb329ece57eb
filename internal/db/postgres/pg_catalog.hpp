#pragma once

#include <memory>
#include <optional>
#include <pqxx/pqxx>

#include "internal/catalog/schema_inspector.hpp"
#include "pg_pool.hpp"

namespace pgshadow::db::postgres {

/*
  PgCatalog

  SchemaInspector over pg_catalog. The static helpers take an open
  transaction so the shadow manager can validate a table it created in the
  same, still uncommitted, transaction.
*/
class PgCatalog final : public catalog::SchemaInspector {
 public:
  explicit PgCatalog(std::shared_ptr<PgPool> pool);

  catalog::ServerInfo Server() override;

  std::optional<catalog::TableInfo> DescribeTable(const model::TableName& table) override;

  catalog::Dependents FindDependents(const model::TableName& table) override;

  catalog::RoleCapabilities CheckCapabilities(const model::TableName& source, const std::string& work_schema,
                                              const std::string& archive_schema) override;

  bool RelationExists(const model::TableName& name) override;

  static catalog::ServerInfo Server(pqxx::transaction_base& tx);
  static std::optional<catalog::TableInfo> DescribeTable(pqxx::transaction_base& tx, const model::TableName& table);
  static bool RelationExists(pqxx::transaction_base& tx, const model::TableName& name);

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace pgshadow::db::postgres
