#include <cassert>
#include <cstring>
#include <iostream>

#include "internal/model/session.hpp"
#include "internal/model/stage.hpp"

namespace {

using satp::model::Stage;

void TestForwardPathIsLinear() {
  Stage stage = Stage::kInitiated;
  int   steps = 0;
  while (auto next = satp::model::NextStage(stage)) {
    assert(satp::model::CanTransition(stage, *next));
    stage = *next;
    ++steps;
  }
  assert(stage == Stage::kCompleted);
  assert(steps == 5);
}

void TestSkippingStagesIsRejected() {
  assert(!satp::model::CanTransition(Stage::kInitiated, Stage::kSourceLockConfirmed));
  assert(!satp::model::CanTransition(Stage::kSourceLockConfirmed, Stage::kSourceLockPending));
  assert(!satp::model::CanTransition(Stage::kInitiated, Stage::kCompleted));
  assert(!satp::model::CanTransition(Stage::kUnspecified, Stage::kInitiated));
}

void TestRollbackEnteredFromAnyNonTerminalStage() {
  for (auto stage : {Stage::kInitiated, Stage::kSourceLockPending, Stage::kSourceLockConfirmed, Stage::kDestinationMintPending,
                     Stage::kDestinationMintConfirmed}) {
    assert(satp::model::CanTransition(stage, Stage::kRollbackPending));
  }
  assert(satp::model::CanTransition(Stage::kRollbackPending, Stage::kRolledBack));
  assert(!satp::model::CanTransition(Stage::kRollbackPending, Stage::kRollbackPending));
  assert(!satp::model::CanTransition(Stage::kRollbackPending, Stage::kCompleted));
}

void TestTerminalStagesAreFinal() {
  assert(satp::model::IsTerminal(Stage::kCompleted));
  assert(satp::model::IsTerminal(Stage::kRolledBack));
  assert(!satp::model::IsTerminal(Stage::kRollbackPending));
  assert(!satp::model::CanTransition(Stage::kCompleted, Stage::kRollbackPending));
  assert(!satp::model::CanTransition(Stage::kRolledBack, Stage::kRollbackPending));
  assert(!satp::model::NextStage(Stage::kRollbackPending).has_value());
}

void TestNamesAndErrorKindsRoundTrip() {
  assert(std::strcmp(satp::model::StageName(Stage::kSourceLockPending), "SOURCE_LOCK_PENDING") == 0);
  assert(std::strcmp(satp::model::StageName(Stage::kRolledBack), "ROLLED_BACK") == 0);

  using satp::model::ErrorKind;
  for (auto kind : {ErrorKind::kLedgerInvocation, ErrorKind::kInvalidState, ErrorKind::kPersistence, ErrorKind::kSessionBusy,
                    ErrorKind::kCancelled, ErrorKind::kCompensationFailed, ErrorKind::kInvalidRequest, ErrorKind::kAborted}) {
    assert(satp::model::ParseErrorKind(satp::model::ErrorKindName(kind)) == kind);
  }
}

} // namespace

int main() {
  TestForwardPathIsLinear();
  TestSkippingStagesIsRejected();
  TestRollbackEnteredFromAnyNonTerminalStage();
  TestTerminalStagesAreFinal();
  TestNamesAndErrorKindsRoundTrip();

  std::cout << "stage_test: pass\n";
  return 0;
}
