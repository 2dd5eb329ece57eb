#include "shadow_layout.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace pgshadow::shadow {

ShadowLayout BuildShadowLayout(const catalog::TableInfo& source, const catalog::TableInfo& shadow,
                               const std::map<std::string, std::string>& renames) {
  if (shadow.primary_key.empty()) {
    throw util::ValidationError("shadow of " + source.name.Display() + " has no primary key; the target DDL must keep one");
  }

  ShadowLayout layout;
  layout.column_map = model::ColumnMap::Build(source.columns, shadow.columns, renames);

  const auto shadow_pk = shadow.primary_key.Names();
  for (const auto& src : source.primary_key.columns) {
    const auto mapping = layout.column_map.ForSource(src.name);
    if (!mapping) {
      throw util::ValidationError("target DDL drops primary key column \"" + src.name + "\" of " + source.name.Display());
    }
    if (std::find(shadow_pk.begin(), shadow_pk.end(), mapping->shadow) == shadow_pk.end()) {
      throw util::ValidationError("shadow primary key of " + source.name.Display() + " does not include \"" +
                                  mapping->shadow + "\"");
    }
    for (const auto& dst : shadow.columns) {
      if (dst.name == mapping->shadow) {
        layout.shadow_key.columns.push_back(dst);
        break;
      }
    }
  }

  layout.conflict_key = shadow.primary_key;
  layout.column_map.SetUpdatableExcluding(shadow_pk, shadow.columns);
  return layout;
}

} // namespace pgshadow::shadow
