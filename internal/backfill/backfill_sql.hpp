#pragma once

#include <string>

#include "internal/model/migration.hpp"

namespace pgshadow::backfill {

/*
  Snapshot reference point:
    -> (max log seq or 0, highest source key as JSON text or NULL)
*/
std::string SnapshotSql(const model::Migration& m);

/*
  One chunk: pick the next ordered keys of the source (key > cursor,
  key <= snapshot max) without locking, lock those rows, insert them into
  the shadow except keys that have a change record newer than the snapshot
  or already have a shadow row, and report what happened. The last key is
  taken from the unlocked scan so the cursor only moves forward.

  Parameters:
    $1 snapshot max key (jsonb)
    $2 snapshot log seq
    $3 chunk size
    $4 cursor (jsonb)          only when has_cursor
  Result: (keys scanned, rows inserted, last scanned key as JSON text or NULL)
*/
std::string CopyChunkSql(const model::Migration& m, bool has_cursor);

// `(($N::jsonb ->> 0)::type0, ($N::jsonb ->> 1)::type1, ...)`
std::string KeyFromJson(const model::PrimaryKey& key, int param);

// `jsonb_build_array(alias."k"::text, ...)::text`
std::string KeyToJson(const model::PrimaryKey& key, const std::string& alias);

} // namespace pgshadow::backfill
