#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "internal/model/migration.hpp"
#include "internal/model/swap_plan.hpp"

namespace pgshadow::cutover {

// Points inside the swap transaction, in order.
enum class SwapStep {
  kLocked,
  kDrained,
  kSourceRenamed,
  kArchived,
  kShadowMoved,
  kSequencesRepointed,
  kRecorded,
};

constexpr std::string_view ToString(SwapStep step) {
  switch (step) {
    case SwapStep::kLocked:
      return "locked";
    case SwapStep::kDrained:
      return "drained";
    case SwapStep::kSourceRenamed:
      return "source_renamed";
    case SwapStep::kShadowMoved:
      return "shadow_moved";
    case SwapStep::kSequencesRepointed:
      return "sequences_repointed";
    case SwapStep::kArchived:
      return "archived";
    case SwapStep::kRecorded:
    default:
      return "recorded";
  }
}

struct SwapOutcome {
  // false: lock_timeout expired, the transaction rolled back, nothing changed
  bool            swapped = false;
  model::SwapPlan plan;
  uint64_t        drained = 0;
};

/*
  SwapCoordinator

  Exchanges the source and shadow identities in one transaction. Any failure
  other than a lock timeout throws util::CutoverError carrying a report of
  where the source, shadow and archived names point afterwards.
*/
class SwapCoordinator {
 public:
  using StepHook = std::function<void(SwapStep)>;

  virtual ~SwapCoordinator() = default;

  virtual SwapOutcome Swap(const model::Migration& m) = 0;

  // Called after each step while the transaction is still open; throwing
  // from the hook fails the swap at that step.
  virtual void SetStepHook(StepHook hook) = 0;
};

} // namespace pgshadow::cutover
