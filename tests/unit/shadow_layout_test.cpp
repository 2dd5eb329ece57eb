#include "internal/shadow/shadow_layout.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using pgshadow::catalog::TableInfo;
using pgshadow::model::Column;
using pgshadow::shadow::BuildShadowLayout;

Column Col(const std::string& name, const std::string& type) {
  Column c;
  c.name = name;
  c.type = type;
  return c;
}

TableInfo Table(const std::string& name, std::vector<Column> columns, const std::vector<std::string>& key) {
  TableInfo t;
  t.name    = {"public", name};
  t.columns = std::move(columns);
  for (const auto& k : key) {
    for (const auto& c : t.columns) {
      if (c.name == k) t.primary_key.columns.push_back(c);
    }
  }
  return t;
}

bool Rejected(const TableInfo& source, const TableInfo& shadow, const std::map<std::string, std::string>& renames = {}) {
  try {
    (void)BuildShadowLayout(source, shadow, renames);
  } catch (const pgshadow::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestAddedColumnLayout() {
  const auto source = Table("accounts", {Col("id", "bigint"), Col("balance", "numeric")}, {"id"});
  const auto shadow = Table("public__accounts", {Col("id", "bigint"), Col("balance", "numeric"), Col("currency", "text")}, {"id"});

  const auto layout = BuildShadowLayout(source, shadow, {});
  assert(layout.shadow_key.Names() == std::vector<std::string>{"id"});
  assert(layout.conflict_key.Names() == std::vector<std::string>{"id"});
  assert(!layout.KeyWidened());
  assert(layout.column_map.updatable() == std::vector<std::string>{"balance"});
  assert(layout.column_map.added() == std::vector<std::string>{"currency"});
}

void TestShadowKeyFollowsSourceKeyOrderAcrossRenames() {
  const auto source = Table("events", {Col("tenant", "int"), Col("id", "bigint"), Col("body", "text")}, {"tenant", "id"});
  // shadow declares its key in the other order and renames tenant
  const auto shadow =
      Table("public__events", {Col("id", "bigint"), Col("tenant_id", "int"), Col("body", "text")}, {"id", "tenant_id"});

  const auto layout = BuildShadowLayout(source, shadow, {{"tenant", "tenant_id"}});
  assert((layout.shadow_key.Names() == std::vector<std::string>{"tenant_id", "id"}));
  assert(layout.shadow_key.columns[0].type == "int");
}

void TestInvalidShadowsAreRejected() {
  const auto source = Table("accounts", {Col("id", "bigint"), Col("email", "text")}, {"id"});

  // no primary key
  assert(Rejected(source, Table("s", {Col("id", "bigint"), Col("email", "text")}, {})));
  // key column dropped
  assert(Rejected(source, Table("s", {Col("uid", "bigint"), Col("email", "text")}, {"uid"})));
  // key moved to a different column
  assert(Rejected(source, Table("s", {Col("id", "bigint"), Col("email", "text")}, {"email"})));
  // source key column missing from a widened key
  assert(Rejected(source, Table("s", {Col("id", "bigint"), Col("email", "text"), Col("at", "date")}, {"email", "at"})));
}

// A partitioned target must carry its partition column in the key.
void TestShadowKeyMayAddPartitionColumn() {
  const auto source = Table("events", {Col("id", "bigint"), Col("at", "timestamptz"), Col("body", "text")}, {"id"});
  const auto shadow =
      Table("public__events", {Col("id", "bigint"), Col("at", "timestamptz"), Col("body", "text")}, {"id", "at"});

  const auto layout = BuildShadowLayout(source, shadow, {});
  assert(layout.shadow_key.Names() == std::vector<std::string>{"id"});
  assert((layout.conflict_key.Names() == std::vector<std::string>{"id", "at"}));
  assert(layout.KeyWidened());
  assert(layout.column_map.updatable() == std::vector<std::string>{"body"});
}

} // namespace

int main() {
  TestAddedColumnLayout();
  TestShadowKeyFollowsSourceKeyOrderAcrossRenames();
  TestInvalidShadowsAreRejected();
  TestShadowKeyMayAddPartitionColumn();

  std::cout << "pgshadow_unit_shadow_layout: pass\n";
  return 0;
}
