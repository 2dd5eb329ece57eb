#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pgshadow::model {

/*
  Orchestrator states.

    Init -> CapturingInstalled -> Backfilling -> Replaying -> QuiescenceCheck
         -> Cutover -> Cleanup -> Done

  Aborting -> Aborted is reachable from every state before Cutover, and from
  Cutover only when every swap attempt timed out on its lock and rolled back
  untouched. Failed is terminal and reachable from anywhere non-terminal.
*/
enum class MigrationPhase : std::uint8_t {
  kInit = 0,
  kCapturingInstalled,
  kBackfilling,
  kReplaying,
  kQuiescenceCheck,
  kCutover,
  kCleanup,
  kDone,
  kAborting,
  kAborted,
  kFailed,
};

constexpr bool IsTerminal(MigrationPhase phase) {
  return phase == MigrationPhase::kDone || phase == MigrationPhase::kAborted || phase == MigrationPhase::kFailed;
}

// True while the source table still holds its original identity and abort
// can restore the pre-migration state.
constexpr bool IsBeforeCutover(MigrationPhase phase) {
  switch (phase) {
    case MigrationPhase::kInit:
    case MigrationPhase::kCapturingInstalled:
    case MigrationPhase::kBackfilling:
    case MigrationPhase::kReplaying:
    case MigrationPhase::kQuiescenceCheck:
      return true;
    default:
      return false;
  }
}

constexpr bool CanTransition(MigrationPhase from, MigrationPhase to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == MigrationPhase::kFailed) {
    return true;
  }
  if (to == MigrationPhase::kAborting) {
    return IsBeforeCutover(from) || from == MigrationPhase::kCutover;
  }

  switch (from) {
    case MigrationPhase::kInit:
      // nothing was created yet, so an abort needs no teardown
      return to == MigrationPhase::kCapturingInstalled || to == MigrationPhase::kAborted;
    case MigrationPhase::kCapturingInstalled:
      return to == MigrationPhase::kBackfilling || to == MigrationPhase::kReplaying;
    case MigrationPhase::kBackfilling:
      return to == MigrationPhase::kReplaying;
    case MigrationPhase::kReplaying:
      return to == MigrationPhase::kQuiescenceCheck;
    case MigrationPhase::kQuiescenceCheck:
      return to == MigrationPhase::kCutover;
    case MigrationPhase::kCutover:
      return to == MigrationPhase::kCleanup;
    case MigrationPhase::kCleanup:
      return to == MigrationPhase::kDone;
    case MigrationPhase::kAborting:
      return to == MigrationPhase::kAborted;
    default:
      return false;
  }
}

constexpr std::string_view ToString(MigrationPhase phase) {
  switch (phase) {
    case MigrationPhase::kInit:
      return "init";
    case MigrationPhase::kCapturingInstalled:
      return "capturing_installed";
    case MigrationPhase::kBackfilling:
      return "backfilling";
    case MigrationPhase::kReplaying:
      return "replaying";
    case MigrationPhase::kQuiescenceCheck:
      return "quiescence_check";
    case MigrationPhase::kCutover:
      return "cutover";
    case MigrationPhase::kCleanup:
      return "cleanup";
    case MigrationPhase::kDone:
      return "done";
    case MigrationPhase::kAborting:
      return "aborting";
    case MigrationPhase::kAborted:
      return "aborted";
    case MigrationPhase::kFailed:
    default:
      return "failed";
  }
}

constexpr std::optional<MigrationPhase> ParsePhase(std::string_view text) {
  for (auto p = static_cast<std::uint8_t>(MigrationPhase::kInit); p <= static_cast<std::uint8_t>(MigrationPhase::kFailed); ++p) {
    const auto phase = static_cast<MigrationPhase>(p);
    if (ToString(phase) == text) {
      return phase;
    }
  }
  return std::nullopt;
}

} // namespace pgshadow::model
