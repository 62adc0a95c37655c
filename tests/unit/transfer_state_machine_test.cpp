#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/ledger/asset_protocol.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/transfer_fixture.hpp"

namespace {

using namespace std::chrono_literals;
using satp::model::ErrorKind;
using satp::model::SessionStatus;
using satp::model::Stage;
using satp::testing::TransferFixture;

// Each backoff moves the manual clock forward by the requested delay.
class ClockAdvancingSleeper final : public satp::retry::Sleeper {
 public:
  explicit ClockAdvancingSleeper(std::shared_ptr<satp::testing::ManualClock> clock) : clock_(std::move(clock)) {
  }

  bool Sleep(std::chrono::milliseconds delay) override {
    delays.push_back(delay);
    clock_->Advance(delay);
    return true;
  }
  void Cancel() override {
  }
  bool Cancelled() const override {
    return false;
  }

  std::vector<std::chrono::milliseconds> delays;

 private:
  std::shared_ptr<satp::testing::ManualClock> clock_;
};

satp::util::TransactError RunExpectingFailure(satp::core::TransferStateMachine& machine, const std::string& session_id,
                                              const satp::core::TransferStateMachine::AbortCheck& abort = {}) {
  try {
    machine.Run(session_id, abort);
  } catch (const satp::util::TransactError& e) {
    return e;
  }
  assert(false && "transfer was expected to fail");
  return satp::util::TransactError(session_id, ErrorKind::kNone, SessionStatus::kUnspecified, "unreachable");
}

void TestSuccessfulTransferWalksEveryStage() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-ok"));

  auto done = fx.machine->Run("s-ok");
  assert(done.status == SessionStatus::kSuccess);
  assert(done.stage == Stage::kCompleted);

  const std::vector<Stage> expected = {Stage::kInitiated,          Stage::kSourceLockPending,        Stage::kSourceLockConfirmed,
                                       Stage::kDestinationMintPending, Stage::kDestinationMintConfirmed, Stage::kCompleted};
  assert(done.stage_history == expected);

  assert(done.receipts.size() == 3);
  assert(done.receipts[0].operation == "lock");
  assert(done.receipts[1].operation == "mint");
  assert(done.receipts[2].operation == "burn");
  assert(done.approve_address == fx.destination->BridgeAddress());

  assert(fx.source->BalanceOf("alice") == 0);
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 0);
  assert(fx.destination->BalanceOf("bob") == 100);
  assert(fx.destination->BalanceOf(fx.destination->BridgeAddress()) == 0);

  assert(fx.store->AuditTrail("s-ok").size() == 1);
  assert(fx.sleeper->Delays().empty());

  // terminal sessions are reported as stored without touching ledgers
  auto again = fx.machine->Run("s-ok");
  assert(again.version == done.version);
  assert(fx.source->InvokeCount("lock") == 1);
}

void TestAmbiguousLockIsProbedNotResubmitted() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-ambiguous"));
  fx.source->FailNext("lock", 1, /*landed=*/true);

  auto done = fx.machine->Run("s-ambiguous");
  assert(done.status == SessionStatus::kSuccess);
  assert(fx.source->InvokeCount("lock") == 1);
  assert(done.receipts[0].operation == "lock");
  assert(done.receipts[0].recovered);
  assert(fx.source->BalanceOf("alice") == 0);
  assert(fx.destination->BalanceOf("bob") == 100);
  assert(fx.sleeper->Delays().size() == 1);
}

void TestExhaustedMintRollsBackAfterExactAttempts() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-mint", 100, 3));
  fx.destination->FailAlways("mint");

  auto error = RunExpectingFailure(*fx.machine, "s-mint");
  assert(std::string(error.what()).find("failed to transact") != std::string::npos);
  assert(error.Kind() == ErrorKind::kLedgerInvocation);
  assert(error.Status() == SessionStatus::kRolledBack);

  assert(fx.destination->InvokeCount("mint") == 3);
  assert((fx.sleeper->Delays() == std::vector<std::chrono::milliseconds>{10ms, 20ms}));

  assert(fx.source->BalanceOf("alice") == 100);
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 0);
  assert(fx.destination->BalanceOf("bob") == 0);

  auto stored = fx.store->Get("s-mint");
  assert(stored.status == SessionStatus::kRolledBack);
  assert(stored.stage == Stage::kRolledBack);
  assert(stored.stage_history.size() >= 2);
  assert(stored.stage_history[stored.stage_history.size() - 2] == Stage::kRollbackPending);
  assert(stored.last_error.kind == ErrorKind::kLedgerInvocation);

  bool unlocked = false;
  for (const auto& receipt : stored.receipts) {
    unlocked = unlocked || (receipt.stage == Stage::kRollbackPending && receipt.operation == "unlock");
  }
  assert(unlocked);
}

void TestStageDeadlineStopsRetries() {
  TransferFixture fx;
  auto sleeper = std::make_shared<ClockAdvancingSleeper>(fx.clock);
  auto machine = fx.MakeMachine(sleeper);

  auto session        = TransferFixture::NewSession("s-deadline", 100, 100);
  session.max_timeout = 50ms;
  fx.Seed(session);
  fx.destination->FailAlways("mint");

  auto error = RunExpectingFailure(*machine, "s-deadline");
  assert(error.Status() == SessionStatus::kRolledBack);

  // 10 + 20, then clipped to the 20ms left before the deadline
  assert((sleeper->delays == std::vector<std::chrono::milliseconds>{10ms, 20ms, 20ms}));
  assert(fx.destination->InvokeCount("mint") == 4);
}

void TestNonRetryableErrorRollsBackImmediately() {
  TransferFixture fx(50);
  fx.Seed(TransferFixture::NewSession("s-poor"));

  auto error = RunExpectingFailure(*fx.machine, "s-poor");
  assert(error.Kind() == ErrorKind::kLedgerInvocation);
  assert(error.Status() == SessionStatus::kRolledBack);
  assert(error.Cause().find("insufficient balance") != std::string::npos);

  assert(fx.source->InvokeCount("lock") == 0);
  assert(fx.source->InvokeCount("unlock") == 0);
  assert(fx.sleeper->Delays().empty());
  assert(fx.source->BalanceOf("alice") == 50);
}

void TestCompensationFailureNeedsOperator() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-stuck"));
  fx.destination->FailAlways("mint", /*retryable=*/false);
  fx.source->FailAlways("unlock", /*retryable=*/false);

  auto error = RunExpectingFailure(*fx.machine, "s-stuck");
  assert(error.Kind() == ErrorKind::kCompensationFailed);
  assert(error.Status() == SessionStatus::kFailed);

  auto stored = fx.store->Get("s-stuck");
  assert(stored.status == SessionStatus::kFailed);
  assert(stored.stage == Stage::kRollbackPending);
  assert(stored.last_error.kind == ErrorKind::kCompensationFailed);
  assert(fx.store->AuditTrail("s-stuck").size() == 1);

  // tokens stay in escrow
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 100);
}

bool HasRollbackReceipt(const satp::model::SessionData& session, const std::string& operation, const std::string& network) {
  for (const auto& receipt : session.receipts) {
    if (receipt.stage == Stage::kRollbackPending && receipt.operation == operation && receipt.network_id.id == network) return true;
  }
  return false;
}

void TestFailedBurnTakesMintedTokensBack() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-noburn"));
  fx.source->FailAlways("burn");

  auto error = RunExpectingFailure(*fx.machine, "s-noburn");
  assert(error.Status() == SessionStatus::kRolledBack);
  assert(fx.source->InvokeCount("burn") == 3);

  auto stored = fx.store->Get("s-noburn");
  assert(HasRollbackReceipt(stored, "burn", satp::testing::kDestinationNetwork.id));
  assert(HasRollbackReceipt(stored, "unlock", satp::testing::kSourceNetwork.id));
  assert(!HasRollbackReceipt(stored, "mint", satp::testing::kSourceNetwork.id));

  assert(fx.source->BalanceOf("alice") == 100);
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 0);
  assert(fx.destination->BalanceOf("bob") == 0);
}

void TestLandedBurnIsReissuedOnSource() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-burned"));
  fx.source->FailNext("burn", 1, /*landed=*/true, /*retryable=*/false);

  auto error = RunExpectingFailure(*fx.machine, "s-burned");
  assert(error.Status() == SessionStatus::kRolledBack);

  auto stored = fx.store->Get("s-burned");
  assert(HasRollbackReceipt(stored, "burn", satp::testing::kDestinationNetwork.id));
  assert(HasRollbackReceipt(stored, "mint", satp::testing::kSourceNetwork.id));
  assert(!HasRollbackReceipt(stored, "unlock", satp::testing::kSourceNetwork.id));

  assert(fx.source->BalanceOf("alice") == 100);
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 0);
  assert(fx.destination->BalanceOf("bob") == 0);
}

void TestResumeAfterCrashRecoversLandedLock() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-crash"));

  // the previous process submitted the lock and died before recording it
  const auto& entry = fx.ledgers->Get(satp::testing::kSourceNetwork);
  auto        seeded = fx.store->Get("s-crash");
  fx.source->Invoke(satp::ledger::AssetProtocol::Action(satp::ledger::Operation::kLock, entry.options, seeded.source_asset, "alice", 100, "s-crash"));
  fx.store->Update("s-crash", [](satp::model::SessionData& session) {
    session.stage = Stage::kSourceLockPending;
    session.stage_history.push_back(Stage::kSourceLockPending);
  });

  auto done = fx.machine->Run("s-crash");
  assert(done.status == SessionStatus::kSuccess);
  assert(fx.source->InvokeCount("lock") == 1);
  assert(done.receipts[0].recovered);
  assert(fx.source->BalanceOf("alice") == 0);
  assert(fx.destination->BalanceOf("bob") == 100);
}

void TestCounterpartyAbortUnlocksEscrow() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-abort"));

  auto source = fx.source;
  auto error  = RunExpectingFailure(*fx.machine, "s-abort", [source] { return source->InvokeCount("lock") >= 1; });
  assert(error.Kind() == ErrorKind::kAborted);
  assert(error.Status() == SessionStatus::kRolledBack);

  assert(fx.destination->InvokeCount("mint") == 0);
  assert(fx.source->InvokeCount("unlock") == 1);
  assert(fx.source->BalanceOf("alice") == 100);
}

void TestConcurrentModificationIsInvalidState() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-raced"));

  auto store = fx.store;
  bool bumped = false;
  auto error  = RunExpectingFailure(*fx.machine, "s-raced", [&] {
    if (!bumped) {
      bumped = true;
      store->Update("s-raced", [](satp::model::SessionData& session) { session.approve_address = "someone-else"; });
    }
    return false;
  });
  assert(error.Kind() == ErrorKind::kInvalidState);
  assert(fx.source->InvokeCount("lock") == 0);
  assert(fx.store->Get("s-raced").status == SessionStatus::kInProgress);
}

void TestCancelledRunCanBeResumed() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-cancel"));
  fx.sleeper->Cancel();

  auto error = RunExpectingFailure(*fx.machine, "s-cancel");
  assert(error.Kind() == ErrorKind::kCancelled);
  assert(error.Status() == SessionStatus::kInProgress);
  assert(fx.store->Get("s-cancel").stage == Stage::kInitiated);

  auto fresh = fx.MakeMachine(std::make_shared<satp::testing::RecordingSleeper>());
  auto done  = fresh->Run("s-cancel");
  assert(done.status == SessionStatus::kSuccess);
}

void TestNonFungibleMovesSingleUnit() {
  TransferFixture fx(1);
  auto session                         = TransferFixture::NewSession("s-nft", 1);
  session.source_asset.token_type      = satp::model::TokenType::kErc721;
  session.destination_asset.token_type = satp::model::TokenType::kErc721;
  fx.Seed(session);

  auto done = fx.machine->Run("s-nft");
  assert(done.status == SessionStatus::kSuccess);
  assert(fx.source->BalanceOf("alice") == 0);
  assert(fx.destination->BalanceOf("bob") == 1);
}

// Answers balance queries itself and forwards everything else.
class BalanceOverride final : public satp::ledger::LedgerAdapter {
 public:
  using Answer = std::function<std::string()>;

  BalanceOverride(std::shared_ptr<satp::ledger::LedgerAdapter> inner, Answer answer) : inner_(std::move(inner)), answer_(std::move(answer)) {
  }

  satp::ledger::InvokeResult Invoke(const satp::ledger::InvokeRequest& request) override {
    return inner_->Invoke(request);
  }

  std::string Query(const satp::ledger::QueryRequest& request) override {
    if (request.method == "balanceOf") return answer_();
    return inner_->Query(request);
  }

  std::string GetApproveAddress(const satp::model::NetworkId& network, satp::model::TokenType token_type) override {
    return inner_->GetApproveAddress(network, token_type);
  }

 private:
  std::shared_ptr<satp::ledger::LedgerAdapter> inner_;
  Answer                                       answer_;
};

std::shared_ptr<satp::core::TransferStateMachine> WithSourceBalance(const TransferFixture& fx, BalanceOverride::Answer answer) {
  auto ledgers = std::make_shared<satp::ledger::LedgerRegistry>();
  ledgers->Register(fx.ledgers->Get(satp::testing::kSourceNetwork).options, std::make_shared<BalanceOverride>(fx.source, std::move(answer)));
  ledgers->Register(fx.ledgers->Get(satp::testing::kDestinationNetwork).options, fx.destination);
  return std::make_shared<satp::core::TransferStateMachine>(fx.store, ledgers, fx.policy, fx.clock, fx.sleeper);
}

void TestWeiSizedBalanceCoversAmount() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-wei"));

  // 100 tokens at 18 decimals does not fit in 64 bits
  auto machine = WithSourceBalance(fx, [] { return std::string("100000000000000000000"); });
  auto done    = machine->Run("s-wei");
  assert(done.status == SessionStatus::kSuccess);
  assert(fx.destination->BalanceOf("bob") == 100);
}

void TestUnexpectedAdapterErrorRollsBack() {
  TransferFixture fx;
  fx.Seed(TransferFixture::NewSession("s-odd"));

  auto machine = WithSourceBalance(fx, []() -> std::string { throw std::out_of_range("connector sent garbage"); });
  auto error   = RunExpectingFailure(*machine, "s-odd");
  assert(error.Kind() == ErrorKind::kLedgerInvocation);
  assert(error.Status() == SessionStatus::kRolledBack);
  assert(error.Cause().find("connector sent garbage") != std::string::npos);

  auto stored = fx.store->Get("s-odd");
  assert(stored.status == SessionStatus::kRolledBack);
  assert(fx.sleeper->Delays().empty());
  assert(fx.source->InvokeCount("lock") == 0);
}

void TestUnknownSessionIsInvalidState() {
  TransferFixture fx;
  auto error = RunExpectingFailure(*fx.machine, "missing");
  assert(error.Kind() == ErrorKind::kInvalidState);
}

} // namespace

int main() {
  TestSuccessfulTransferWalksEveryStage();
  TestAmbiguousLockIsProbedNotResubmitted();
  TestExhaustedMintRollsBackAfterExactAttempts();
  TestStageDeadlineStopsRetries();
  TestNonRetryableErrorRollsBackImmediately();
  TestCompensationFailureNeedsOperator();
  TestFailedBurnTakesMintedTokensBack();
  TestLandedBurnIsReissuedOnSource();
  TestResumeAfterCrashRecoversLandedLock();
  TestCounterpartyAbortUnlocksEscrow();
  TestConcurrentModificationIsInvalidState();
  TestCancelledRunCanBeResumed();
  TestNonFungibleMovesSingleUnit();
  TestWeiSizedBalanceCoversAmount();
  TestUnexpectedAdapterErrorRollsBack();
  TestUnknownSessionIsInvalidState();

  std::cout << "transfer_state_machine_test: pass\n";
  return 0;
}
