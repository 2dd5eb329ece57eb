#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/change_record.hpp"

namespace pgshadow::replay {

/*
  Net effect of one batch of change records, applied in this order:
    1. truncate (clear the shadow) if the batch held a truncate record
    2. deletes
    3. upserts

  Per key only the last record counts. A truncate is a barrier: records
  before it are discarded, records after it survive.
*/
struct ReplayPlan {
  bool                     truncate = false;
  std::vector<std::string> delete_keys;    // JSON key arrays
  std::vector<std::string> upsert_images;  // jsonb row images
  int64_t                  max_seq  = 0;
  std::size_t              consumed = 0;

  bool empty() const {
    return !truncate && delete_keys.empty() && upsert_images.empty();
  }

  std::size_t applied() const {
    return delete_keys.size() + upsert_images.size() + (truncate ? 1 : 0);
  }
};

// `records` need not be sorted; they are ordered by seq first.
ReplayPlan PlanBatch(std::vector<model::ChangeRecord> records);

// "[a,b,...]" from JSON texts
std::string JsonArrayOf(const std::vector<std::string>& elements);

} // namespace pgshadow::replay
