#pragma once

#include <string>
#include <string_view>

namespace pgshadow::registry {

/*
  SQL text for the registry table. Every statement that touches a row takes
  ($1 source_schema, $2 source_name) first.
*/

std::string CreateRegistrySql(std::string_view work_schema);

// $3 phase
std::string UpdatePhaseSql(std::string_view work_schema);

// $3 cursor jsonb (NULL keeps the old one), $4 rows copied by this chunk,
// $5 backfill_done
std::string BackfillProgressSql(std::string_view work_schema);

// $3 highest seq in the batch, $4 changes applied by this batch
std::string ReplayProgressSql(std::string_view work_schema);

} // namespace pgshadow::registry
