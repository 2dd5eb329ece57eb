#pragma once

#include <map>
#include <string>

#include "internal/catalog/schema_inspector.hpp"
#include "internal/model/column_map.hpp"

namespace pgshadow::shadow {

/*
  How rows move from source to shadow.

  shadow_key lists the shadow columns the source key maps to, in source
  key order, so a key captured from the source addresses the same row in
  the shadow. conflict_key is the shadow's full primary key. It is wider
  than shadow_key when the target adds key columns, e.g. the partition
  column of a partitioned target.
*/
struct ShadowLayout {
  model::ColumnMap  column_map;
  model::PrimaryKey shadow_key;
  model::PrimaryKey conflict_key;

  bool KeyWidened() const {
    return conflict_key.columns.size() > shadow_key.columns.size();
  }
};

/*
  Checks that `shadow` can stand in for `source` and derives the layout.
  Throws util::ValidationError when:
    - the shadow has no primary key
    - a source key column is dropped by the DDL
    - the shadow key does not contain every mapped source key column
*/
ShadowLayout BuildShadowLayout(const catalog::TableInfo& source, const catalog::TableInfo& shadow,
                               const std::map<std::string, std::string>& renames);

} // namespace pgshadow::shadow
