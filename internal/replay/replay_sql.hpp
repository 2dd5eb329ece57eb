#pragma once

#include <string>

#include "internal/model/migration.hpp"

namespace pgshadow::replay {

// $1 batch size -> (seq, op, key json text, row_image text), oldest first.
// The records are deleted by the same statement.
std::string TakeBatchSql(const model::Migration& m);

std::string ClearShadowSql(const model::Migration& m);

// $1 jsonb array of key arrays
std::string DeleteKeysSql(const model::Migration& m);

// $1 jsonb array of row images (source row type). Deletes the shadow rows
// holding the images' source keys. Runs before the upsert when the shadow
// key is wider than the source key, since an image whose extra key columns
// changed would otherwise land beside the stale row instead of replacing it.
std::string DeleteImageKeysSql(const model::Migration& m);

// $1 jsonb array of row images (source row type)
std::string UpsertImagesSql(const model::Migration& m);

std::string BacklogSql(const model::Migration& m);

} // namespace pgshadow::replay
