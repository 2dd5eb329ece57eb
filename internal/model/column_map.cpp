#include "column_map.hpp"

#include <algorithm>

namespace pgshadow::model {

namespace {

const Column* Find(const std::vector<Column>& columns, const std::string& name) {
  auto it = std::find_if(columns.begin(), columns.end(), [&](const Column& c) { return c.name == name; });
  return it == columns.end() ? nullptr : &*it;
}

} // namespace

ColumnMap ColumnMap::Build(const std::vector<Column>& source, const std::vector<Column>& shadow,
                           const std::map<std::string, std::string>& renames) {
  ColumnMap map;
  std::vector<std::string> used_shadow;

  for (const auto& src : source) {
    std::string target = src.name;
    if (auto it = renames.find(src.name); it != renames.end()) {
      target = it->second;
    }

    const Column* dst = Find(shadow, target);
    if (dst == nullptr || dst->generated) {
      map.dropped_.push_back(src.name);
      continue;
    }

    map.mappings_.push_back(ColumnMapping{src.name, dst->name, src.type, dst->type});
    used_shadow.push_back(dst->name);
  }

  for (const auto& dst : shadow) {
    if (std::find(used_shadow.begin(), used_shadow.end(), dst.name) == used_shadow.end()) {
      map.added_.push_back(dst.name);
    }
  }

  map.SetUpdatableExcluding({}, shadow);
  return map;
}

std::optional<ColumnMapping> ColumnMap::ForSource(const std::string& source_column) const {
  for (const auto& m : mappings_) {
    if (m.source == source_column) {
      return m;
    }
  }
  return std::nullopt;
}

void ColumnMap::SetUpdatableExcluding(const std::vector<std::string>& shadow_key, const std::vector<Column>& shadow) {
  updatable_.clear();
  for (const auto& m : mappings_) {
    if (std::find(shadow_key.begin(), shadow_key.end(), m.shadow) != shadow_key.end()) {
      continue;
    }
    const Column* dst = Find(shadow, m.shadow);
    if (dst != nullptr && dst->identity_always) {
      continue;
    }
    updatable_.push_back(m.shadow);
  }
}

} // namespace pgshadow::model
