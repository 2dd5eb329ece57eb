#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/migration.hpp"

namespace pgshadow::backfill {

struct ChunkResult {
  uint64_t                   scanned = 0;
  uint64_t                   copied  = 0;
  // key of the last scanned row; absent when the slice was empty
  std::optional<std::string> last_key;
};

/*
  ChunkCopier

  One chunk is one transaction: the shadow rows and the advanced cursor in
  the registry commit together or not at all.
*/
class ChunkCopier {
 public:
  virtual ~ChunkCopier() = default;

  virtual model::Snapshot TakeSnapshot(const model::Migration& m) = 0;

  virtual ChunkResult CopyChunk(const model::Migration& m, const std::optional<std::string>& cursor, uint32_t limit) = 0;
};

} // namespace pgshadow::backfill
