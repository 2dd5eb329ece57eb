#pragma once

#include <cstddef>
#include <cstdint>

#include "internal/model/migration.hpp"

namespace pgshadow::replay {

struct BatchResult {
  std::size_t consumed = 0;  // log records removed
  std::size_t applied  = 0;  // net shadow operations
  int64_t     max_seq  = 0;
};

/*
  ChangeApplier

  ApplyBatch takes the oldest records out of the log, applies their net
  effect to the shadow and advances the registry watermark, all in one
  transaction. Applying the same images twice leaves the shadow unchanged.
*/
class ChangeApplier {
 public:
  virtual ~ChangeApplier() = default;

  virtual BatchResult ApplyBatch(const model::Migration& m, uint32_t batch_size) = 0;

  // Records still in the log, committed ones only.
  virtual uint64_t Backlog(const model::Migration& m) = 0;
};

} // namespace pgshadow::replay
