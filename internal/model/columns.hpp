#pragma once

#include <string>
#include <vector>

namespace pgshadow::model {

struct Column {
  std::string name;
  // format_type() text, e.g. "bigint", "character varying(32)"
  std::string type;
  bool        not_null        = false;
  bool        generated       = false;
  bool        identity_always = false;
};

/*
  Primary key columns in key order.

  Required on the source: ordered capture, chunked backfill and keyed replay
  all address rows through it.
*/
struct PrimaryKey {
  std::vector<Column> columns;

  bool empty() const {
    return columns.empty();
  }

  std::vector<std::string> Names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& c : columns) names.push_back(c.name);
    return names;
  }
};

} // namespace pgshadow::model
