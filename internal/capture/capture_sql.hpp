#pragma once

#include <string>
#include <vector>

#include "internal/model/columns.hpp"
#include "internal/model/naming.hpp"

namespace pgshadow::capture {

/*
  Change log layout:

    seq          bigserial PRIMARY KEY
    op           char(1)   'I' | 'U' | 'D' | 'T'
    k1 .. kN     source primary key columns, source types (NULL for 'T')
    row_image    jsonb     to_jsonb(NEW) for 'I' / 'U'
    captured_at  timestamptz

  Key columns are positional so no source column name can collide with the
  log's own columns.
*/

// "k1", "k2", ...
std::vector<std::string> LogKeyColumns(const model::PrimaryKey& key);

std::string CreateLogTableSql(const model::ArtifactNames& names, const model::PrimaryKey& key);

std::string CreateRowFunctionSql(const model::ArtifactNames& names, const model::PrimaryKey& key);

std::string CreateTruncateFunctionSql(const model::ArtifactNames& names);

// Drop-then-create for every trigger; safe to re-run.
std::string CreateTriggersSql(const model::TableName& source, const model::ArtifactNames& names);

std::string DropTriggersSql(const model::TableName& table);

std::string DropFunctionsSql(const model::ArtifactNames& names);

std::string DropLogSql(const model::ArtifactNames& names);

} // namespace pgshadow::capture
