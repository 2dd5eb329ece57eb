#include "pg_catalog.hpp"

#include "pg_tx.hpp"

namespace pgshadow::db::postgres {

namespace {

std::vector<std::string> Column0(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(row[0].as<std::string>());
  }
  return out;
}

} // namespace

PgCatalog::PgCatalog(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

catalog::ServerInfo PgCatalog::Server(pqxx::transaction_base& tx) {
  auto res = tx.exec("SELECT current_setting('server_version_num')::int, current_setting('server_version');");

  catalog::ServerInfo info;
  info.version_num = res[0][0].as<int>();
  info.version     = res[0][1].as<std::string>();
  return info;
}

std::optional<catalog::TableInfo> PgCatalog::DescribeTable(pqxx::transaction_base& tx, const model::TableName& table) {
  auto rel = tx.exec_params("SELECT c.oid, c.relkind, c.relispartition FROM pg_class c WHERE c.oid = to_regclass($1::text);",
                            table.Qualified());
  if (rel.empty()) {
    return std::nullopt;
  }

  const auto oid = rel[0][0].as<pqxx::oid>();

  catalog::TableInfo info;
  info.name         = table;
  info.relkind      = rel[0][1].as<std::string>().front();
  info.is_partition = rel[0][2].as<bool>();

  // attgenerated appeared in 12
  const bool        has_generated = Server(tx).version_num >= 120000;
  const std::string generated     = has_generated ? "a.attgenerated <> ''" : "false";

  auto cols = tx.exec_params("SELECT a.attname, format_type(a.atttypid, a.atttypmod), a.attnotnull, " + generated +
                                 ", a.attidentity = 'a' "
                                 "FROM pg_attribute a "
                                 "WHERE a.attrelid = $1 AND a.attnum > 0 AND NOT a.attisdropped "
                                 "ORDER BY a.attnum;",
                             oid);
  for (const auto& row : cols) {
    info.columns.push_back(model::Column{
        .name            = row[0].as<std::string>(),
        .type            = row[1].as<std::string>(),
        .not_null        = row[2].as<bool>(),
        .generated       = row[3].as<bool>(),
        .identity_always = row[4].as<bool>(),
    });
  }

  auto pk = tx.exec_params("SELECT a.attname "
                           "FROM pg_index i "
                           "CROSS JOIN LATERAL unnest(i.indkey) WITH ORDINALITY AS k(attnum, ord) "
                           "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = k.attnum "
                           "WHERE i.indrelid = $1 AND i.indisprimary "
                           "ORDER BY k.ord;",
                           oid);
  for (const auto& row : pk) {
    const auto name = row[0].as<std::string>();
    for (const auto& c : info.columns) {
      if (c.name == name) {
        info.primary_key.columns.push_back(c);
        break;
      }
    }
  }

  return info;
}

bool PgCatalog::RelationExists(pqxx::transaction_base& tx, const model::TableName& name) {
  auto res = tx.exec_params("SELECT to_regclass($1::text) IS NOT NULL;", name.Qualified());
  return res[0][0].as<bool>();
}

catalog::ServerInfo PgCatalog::Server() {
  PgTransaction tx(pool_);
  auto          info = Server(tx.Work());
  tx.Commit();
  return info;
}

std::optional<catalog::TableInfo> PgCatalog::DescribeTable(const model::TableName& table) {
  PgTransaction tx(pool_);
  auto          info = DescribeTable(tx.Work(), table);
  tx.Commit();
  return info;
}

bool PgCatalog::RelationExists(const model::TableName& name) {
  PgTransaction tx(pool_);
  const bool    exists = RelationExists(tx.Work(), name);
  tx.Commit();
  return exists;
}

catalog::Dependents PgCatalog::FindDependents(const model::TableName& table) {
  PgTransaction tx(pool_);
  auto&         w   = tx.Work();
  const auto    rel = table.Qualified();

  catalog::Dependents deps;

  deps.views = Column0(w.exec_params("SELECT DISTINCT v.oid::regclass::text "
                                     "FROM pg_depend d "
                                     "JOIN pg_rewrite r ON r.oid = d.objid "
                                     "JOIN pg_class v ON v.oid = r.ev_class "
                                     "WHERE d.classid = 'pg_rewrite'::regclass "
                                     "  AND d.refclassid = 'pg_class'::regclass "
                                     "  AND d.refobjid = to_regclass($1::text) "
                                     "  AND v.oid <> d.refobjid;",
                                     rel));

  deps.inbound_foreign_keys = Column0(w.exec_params("SELECT conname || ' on ' || conrelid::regclass::text "
                                                    "FROM pg_constraint "
                                                    "WHERE contype = 'f' AND confrelid = to_regclass($1::text) "
                                                    "  AND conrelid <> confrelid;",
                                                    rel));

  deps.outbound_foreign_keys = Column0(w.exec_params("SELECT conname || ' -> ' || confrelid::regclass::text "
                                                     "FROM pg_constraint "
                                                     "WHERE contype = 'f' AND conrelid = to_regclass($1::text);",
                                                     rel));

  deps.user_triggers = Column0(w.exec_params("SELECT tgname FROM pg_trigger "
                                             "WHERE tgrelid = to_regclass($1::text) AND NOT tgisinternal "
                                             "  AND tgname NOT LIKE 'pgshadow\\_capture\\_%';",
                                             rel));

  tx.Commit();
  return deps;
}

catalog::RoleCapabilities PgCatalog::CheckCapabilities(const model::TableName& source, const std::string& work_schema,
                                                       const std::string& archive_schema) {
  PgTransaction tx(pool_);

  auto res = tx.Work().exec_params(
      "SELECT current_user::text, "
      "  pg_has_role(current_user, c.relowner, 'USAGE'), "
      "  has_table_privilege(c.oid, 'TRIGGER'), "
      "  has_schema_privilege(c.relnamespace, 'CREATE'), "
      "  CASE WHEN to_regnamespace($2::text) IS NULL "
      "       THEN has_database_privilege(current_database(), 'CREATE') "
      "       ELSE has_schema_privilege($4::text, 'CREATE') END, "
      "  CASE WHEN to_regnamespace($3::text) IS NULL "
      "       THEN has_database_privilege(current_database(), 'CREATE') "
      "       ELSE has_schema_privilege($5::text, 'CREATE') END, "
      "  (SELECT r.rolreplication OR r.rolsuper FROM pg_roles r WHERE r.rolname = current_user) "
      "FROM pg_class c WHERE c.oid = to_regclass($1::text);",
      // to_regnamespace parses quoting, has_schema_privilege takes the bare name
      source.Qualified(), model::QuoteIdent(work_schema), model::QuoteIdent(archive_schema), work_schema, archive_schema);
  tx.Commit();

  catalog::RoleCapabilities caps;
  if (res.empty()) {
    return caps;
  }

  const auto& row                   = res[0];
  caps.role                         = row[0].as<std::string>();
  caps.owns_source                  = row[1].as<bool>();
  caps.can_trigger                  = row[2].as<bool>();
  caps.can_create_in_source_schema  = row[3].as<bool>();
  caps.can_create_work_schema       = row[4].as<bool>();
  caps.can_create_archive_schema    = row[5].as<bool>();
  caps.can_replicate                = !row[6].is_null() && row[6].as<bool>();
  return caps;
}

} // namespace pgshadow::db::postgres
