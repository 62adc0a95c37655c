#pragma once

#include <cstdint>
#include <optional>

namespace satp::model {

/*
  Transfer stages. Numbering matches satp.gateway.v1.Stage.

  Forward path:
    INITIATED -> SOURCE_LOCK_PENDING -> SOURCE_LOCK_CONFIRMED
      -> DESTINATION_MINT_PENDING -> DESTINATION_MINT_CONFIRMED -> COMPLETED

  Rollback path, entered from any non-terminal stage:
    ROLLBACK_PENDING -> ROLLED_BACK
*/
enum class Stage : std::uint8_t {
  kUnspecified              = 0,
  kInitiated                = 1,
  kSourceLockPending        = 2,
  kSourceLockConfirmed      = 3,
  kDestinationMintPending   = 4,
  kDestinationMintConfirmed = 5,
  kCompleted                = 6,
  kRollbackPending          = 7,
  kRolledBack               = 8,
};

constexpr bool IsTerminal(Stage stage) {
  return stage == Stage::kCompleted || stage == Stage::kRolledBack;
}

constexpr bool IsForward(Stage stage) {
  return stage >= Stage::kInitiated && stage <= Stage::kCompleted;
}

constexpr std::optional<Stage> NextStage(Stage stage) {
  if (!IsForward(stage) || stage == Stage::kCompleted) {
    return std::nullopt;
  }
  return static_cast<Stage>(static_cast<std::uint8_t>(stage) + 1);
}

constexpr bool CanTransition(Stage from, Stage to) {
  if (IsTerminal(from) || from == Stage::kUnspecified) {
    return false;
  }
  if (to == Stage::kRollbackPending) {
    return from != Stage::kRollbackPending;
  }
  if (from == Stage::kRollbackPending) {
    return to == Stage::kRolledBack;
  }
  return NextStage(from) == to;
}

const char* StageName(Stage stage);

} // namespace satp::model
