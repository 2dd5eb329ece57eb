#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/columns.hpp"
#include "internal/model/table_name.hpp"

namespace pgshadow::catalog {

struct TableInfo {
  model::TableName           name;
  // pg_class.relkind: 'r' ordinary, 'p' partitioned
  char                       relkind        = 'r';
  bool                       is_partition   = false;
  std::vector<model::Column> columns;
  model::PrimaryKey          primary_key;
};

/*
  Objects that reference the table by OID and would follow the archived
  copy on rename. Views and inbound foreign keys block the migration;
  the rest is reported as a warning.
*/
struct Dependents {
  std::vector<std::string> views;
  std::vector<std::string> inbound_foreign_keys;
  std::vector<std::string> outbound_foreign_keys;
  std::vector<std::string> user_triggers;

  bool Blocking() const {
    return !views.empty() || !inbound_foreign_keys.empty();
  }
};

struct RoleCapabilities {
  std::string role;
  bool        owns_source                = false;
  bool        can_trigger                = false;
  bool        can_create_in_source_schema = false;
  bool        can_create_work_schema     = false;
  bool        can_create_archive_schema  = false;
  // logged only; needed by a replication-based capture mode
  bool        can_replicate              = false;
};

struct ServerInfo {
  int         version_num = 0;  // server_version_num, e.g. 160002
  std::string version;
};

/*
  SchemaInspector

  Read-only catalog queries used by validation at Init.
  Implementations: db::postgres::PgCatalog, and fakes in tests.
*/
class SchemaInspector {
 public:
  virtual ~SchemaInspector() = default;

  virtual ServerInfo Server() = 0;

  // nullopt when no such relation exists
  virtual std::optional<TableInfo> DescribeTable(const model::TableName& table) = 0;

  virtual Dependents FindDependents(const model::TableName& table) = 0;

  virtual RoleCapabilities CheckCapabilities(const model::TableName& source, const std::string& work_schema,
                                             const std::string& archive_schema) = 0;

  // any relation kind
  virtual bool RelationExists(const model::TableName& name) = 0;
};

} // namespace pgshadow::catalog
