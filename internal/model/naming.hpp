#pragma once

#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "table_name.hpp"

namespace pgshadow::model {

inline constexpr std::string_view kRegistryTable = "migrations";

// Trigger names on the source table; fixed so uninstall never needs state.
inline constexpr std::string_view kInsertTrigger   = "pgshadow_capture_ins";
inline constexpr std::string_view kUpdateTrigger   = "pgshadow_capture_upd";
inline constexpr std::string_view kDeleteTrigger   = "pgshadow_capture_del";
inline constexpr std::string_view kTruncateTrigger = "pgshadow_capture_trunc";

/*
  Joins `base` and `suffix`, shortening `base` so the result stays within
  kMaxIdentifierLength. A shortened base gets an 8-hex-digit hash of the
  full base so distinct long names stay distinct.
*/
std::string FitIdentifier(std::string_view base, std::string_view suffix = {});

/*
  Every object one migration creates, derived from the source name alone so
  a restarted process finds the same objects.
*/
struct ArtifactNames {
  TableName   shadow;             // work.<schema>__<name>
  TableName   log;                // work.<schema>__<name>__log
  std::string row_function;       // in work schema
  std::string truncate_function;  // in work schema
  std::string log_key_index;
};

ArtifactNames DeriveArtifactNames(const TableName& source, std::string_view work_schema);

// Registry row location.
TableName RegistryTable(std::string_view work_schema);

/*
  archive.<name>_<YYYYMMDDhhmmss>, with `_<collision>` appended when
  collision > 0.
*/
TableName ArchivedName(const TableName& source, std::string_view archive_schema, util::TimePoint at, int collision = 0);

} // namespace pgshadow::model
