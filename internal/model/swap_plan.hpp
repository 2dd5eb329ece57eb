#pragma once

#include "table_name.hpp"

namespace pgshadow::model {

/*
  Renames performed by one cutover, computed right before it and never
  persisted.

    source        -> source.schema.archived.name  -> archived
    shadow        -> source.schema.shadow.name    -> source
*/
struct SwapPlan {
  TableName source;
  TableName shadow;
  TableName archived;
};

} // namespace pgshadow::model
