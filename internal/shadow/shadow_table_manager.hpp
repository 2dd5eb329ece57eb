#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/catalog/schema_inspector.hpp"
#include "shadow_layout.hpp"

namespace pgshadow::shadow {

struct ShadowSpec {
  model::TableName                   source;
  model::TableName                   shadow;
  // target DDL, already retargeted at `shadow`
  std::vector<std::string>           statements;
  bool                               redefines_table = false;
  std::map<std::string, std::string> column_renames;
};

/*
  ShadowTableManager

  Create() builds the shadow and validates it in one transaction; a shadow
  that fails validation is never committed.
*/
class ShadowTableManager {
 public:
  virtual ~ShadowTableManager() = default;

  virtual ShadowLayout Create(const ShadowSpec& spec, const catalog::TableInfo& source) = 0;

  // Re-derives the layout of a shadow created by an earlier run.
  virtual ShadowLayout Load(const ShadowSpec& spec, const catalog::TableInfo& source) = 0;

  virtual bool Exists(const model::TableName& shadow) = 0;

  // No-op when absent.
  virtual void Drop(const model::TableName& shadow) = 0;
};

} // namespace pgshadow::shadow
