#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "columns.hpp"

namespace pgshadow::model {

struct ColumnMapping {
  std::string source;
  std::string shadow;
  std::string source_type;
  std::string shadow_type;

  bool NeedsCast() const {
    return source_type != shadow_type;
  }
};

/*
  ColumnMap

  Which source column feeds which shadow column.

  - Same-name columns map to each other.
  - Explicit renames (from RENAME COLUMN in the target DDL) map old -> new.
  - Generated shadow columns are never written.
  - Source columns without a counterpart are dropped by the migration.
  - Shadow columns without a source get their DEFAULT on insert.
*/
class ColumnMap {
 public:
  ColumnMap() = default;

  static ColumnMap Build(const std::vector<Column>& source, const std::vector<Column>& shadow,
                         const std::map<std::string, std::string>& renames = {});

  const std::vector<ColumnMapping>& mappings() const {
    return mappings_;
  }

  bool empty() const {
    return mappings_.empty();
  }

  std::optional<ColumnMapping> ForSource(const std::string& source_column) const;

  const std::vector<std::string>& dropped() const {
    return dropped_;
  }

  const std::vector<std::string>& added() const {
    return added_;
  }

  // Shadow columns an upsert may overwrite: mapped, not in `key`, not
  // GENERATED ALWAYS AS IDENTITY.
  const std::vector<std::string>& updatable() const {
    return updatable_;
  }

  void SetUpdatableExcluding(const std::vector<std::string>& shadow_key, const std::vector<Column>& shadow);

 private:
  std::vector<ColumnMapping> mappings_;
  std::vector<std::string>   dropped_;
  std::vector<std::string>   added_;
  std::vector<std::string>   updatable_;
};

} // namespace pgshadow::model
