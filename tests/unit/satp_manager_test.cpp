#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/satp_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/interposing_repository.hpp"
#include "tests/unit/transfer_fixture.hpp"

namespace {

using satp::core::CounterpartyMessage;
using satp::core::SatpManager;
using satp::model::ErrorKind;
using satp::model::SessionStatus;
using satp::testing::TransferFixture;

// Holds the first balance query until the test lets it through.
class GatedLedger final : public satp::ledger::LedgerAdapter {
 public:
  explicit GatedLedger(std::shared_ptr<satp::ledger::SimulatedLedger> inner)
      : inner_(std::move(inner)), release_(release_promise_.get_future().share()) {
  }

  satp::ledger::InvokeResult Invoke(const satp::ledger::InvokeRequest& request) override {
    return inner_->Invoke(request);
  }

  std::string Query(const satp::ledger::QueryRequest& request) override {
    if (!gated_.exchange(true)) {
      entered_.set_value();
      release_.wait();
    }
    return inner_->Query(request);
  }

  std::string GetApproveAddress(const satp::model::NetworkId& network, satp::model::TokenType token_type) override {
    return inner_->GetApproveAddress(network, token_type);
  }

  void WaitEntered() {
    entered_future_.wait();
  }

  void Release() {
    release_promise_.set_value();
  }

 private:
  std::shared_ptr<satp::ledger::SimulatedLedger> inner_;
  std::atomic<bool>                              gated_{false};
  std::promise<void>                             entered_;
  std::future<void>                              entered_future_ = entered_.get_future();
  std::promise<void>                             release_promise_;
  std::shared_future<void>                       release_;
};

std::unique_ptr<SatpManager> MakeManager(const TransferFixture& fx, std::shared_ptr<satp::core::TransferStateMachine> machine = nullptr) {
  return std::make_unique<SatpManager>(fx.store, machine ? machine : fx.machine, fx.sleeper, SatpManager::Options{4});
}

void TestCompletedSessionIsNotReExecuted() {
  TransferFixture fx;
  auto            manager = MakeManager(fx);

  auto done = manager->Transfer(TransferFixture::NewSession("s-once")).get();
  assert(done.status == SessionStatus::kSuccess);

  const auto locks    = fx.source->InvokeCount("lock");
  const auto balances = fx.source->QueryCount("balanceOf");

  auto again = manager->Transfer(TransferFixture::NewSession("s-once")).get();
  assert(again.status == SessionStatus::kSuccess);
  assert(again.version == done.version);
  assert(fx.source->InvokeCount("lock") == locks);
  assert(fx.source->QueryCount("balanceOf") == balances);
  assert(fx.destination->BalanceOf("bob") == 100);
}

void TestSecondCallerIsBusyWhileExecuting() {
  TransferFixture fx;
  auto            gate    = std::make_shared<GatedLedger>(fx.source);
  auto            ledgers = std::make_shared<satp::ledger::LedgerRegistry>();
  ledgers->Register(fx.ledgers->Get(satp::testing::kSourceNetwork).options, gate);
  ledgers->Register(fx.ledgers->Get(satp::testing::kDestinationNetwork).options, fx.destination);

  auto machine = std::make_shared<satp::core::TransferStateMachine>(fx.store, ledgers, fx.policy, fx.clock, fx.sleeper);
  auto manager = MakeManager(fx, machine);

  auto first = manager->Transfer(TransferFixture::NewSession("s-busy"));
  gate->WaitEntered();
  assert(manager->Sessions().IsRunning("s-busy"));

  const auto version = fx.store->Get("s-busy").version;
  bool       busy    = false;
  try {
    manager->Transfer(TransferFixture::NewSession("s-busy"));
  } catch (const satp::util::SessionBusyError& e) {
    busy = e.SessionId() == "s-busy";
  }
  assert(busy);
  assert(fx.store->Get("s-busy").version == version);

  gate->Release();
  assert(first.get().status == SessionStatus::kSuccess);
}

void TestExhaustedSessionStaysInspectableUntilRemoved() {
  TransferFixture fx;
  auto            manager = MakeManager(fx);
  fx.destination->FailAlways("mint");

  auto future = manager->Transfer(TransferFixture::NewSession("s-fail"));
  bool failed = false;
  try {
    future.get();
  } catch (const satp::util::TransactError& e) {
    failed = std::string(e.what()).find("failed to transact") != std::string::npos && e.Status() == SessionStatus::kRolledBack;
  }
  assert(failed);
  assert(fx.destination->InvokeCount("mint") == 3);

  auto entry = manager->Sessions().Get("s-fail");
  assert(entry.has_value());
  assert(entry->status == SessionStatus::kRolledBack);
  assert(!entry->running);

  // re-invoking right away reports the recorded outcome, not busy
  bool recorded = false;
  try {
    manager->Transfer(TransferFixture::NewSession("s-fail")).get();
  } catch (const satp::util::TransactError& e) {
    recorded = e.Kind() == ErrorKind::kLedgerInvocation;
  }
  assert(recorded);
  assert(fx.destination->InvokeCount("mint") == 3);

  manager->Sessions().Remove("s-fail");
  assert(!manager->Sessions().Has("s-fail"));
}

void TestSessionsRunIndependently() {
  TransferFixture fx(800);
  auto            manager = MakeManager(fx);

  std::vector<std::future<satp::model::SessionData>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(manager->Transfer(TransferFixture::NewSession("s-par-" + std::to_string(i))));
  }
  for (auto& future : futures) {
    assert(future.get().status == SessionStatus::kSuccess);
  }

  assert(fx.source->BalanceOf("alice") == 0);
  assert(fx.source->BalanceOf(fx.source->BridgeAddress()) == 0);
  assert(fx.destination->BalanceOf("bob") == 800);
  assert(manager->Sessions().Size() == 8);
}

void TestShutdownThenRecovery() {
  TransferFixture fx;
  {
    auto manager = MakeManager(fx);
    manager->Shutdown();

    bool cancelled = false;
    try {
      manager->Transfer(TransferFixture::NewSession("s-late")).get();
    } catch (const satp::util::TransactError& e) {
      cancelled = e.Kind() == ErrorKind::kCancelled && e.Status() == SessionStatus::kInProgress;
    }
    assert(cancelled);
  }
  assert(fx.store->Get("s-late").status == SessionStatus::kInProgress);

  auto sleeper = std::make_shared<satp::testing::RecordingSleeper>();
  SatpManager restarted(fx.store, fx.MakeMachine(sleeper), sleeper, SatpManager::Options{2});
  assert(restarted.RecoverPendingSessions() == 1);

  auto done = satp::testing::WaitForTerminal(*fx.store, "s-late");
  assert(done.status == SessionStatus::kSuccess);
  assert(fx.destination->BalanceOf("bob") == 100);
}

void TestAbortDeliveredToIdleSessionRollsBack() {
  TransferFixture fx;
  auto            manager = MakeManager(fx);
  fx.Seed(TransferFixture::NewSession("s-idle"));

  assert(manager->Deliver({"s-idle", CounterpartyMessage::Type::kAbort, "counterparty gave up"}));

  auto done = satp::testing::WaitForTerminal(*fx.store, "s-idle");
  assert(done.status == SessionStatus::kRolledBack);
  assert(done.last_error.kind == ErrorKind::kAborted);
  assert(fx.source->InvokeCount("lock") == 0);

  assert(!manager->Deliver({"missing", CounterpartyMessage::Type::kAbort, ""}));
  assert(!manager->Deliver({"s-idle", CounterpartyMessage::Type::kResume, ""}));
}

// A run that starts while an abort is being delivered must see the abort,
// not a session whose version moved underneath it.
void TestAbortRacingTransferIsHonoured() {
  TransferFixture fx;
  auto            repository = std::make_shared<satp::testing::InterposingRepository>(fx.repository);
  fx.store                   = std::make_shared<satp::store::SessionStore>(repository);

  auto gate    = std::make_shared<GatedLedger>(fx.source);
  auto ledgers = std::make_shared<satp::ledger::LedgerRegistry>();
  ledgers->Register(fx.ledgers->Get(satp::testing::kSourceNetwork).options, gate);
  ledgers->Register(fx.ledgers->Get(satp::testing::kDestinationNetwork).options, fx.destination);

  auto machine = std::make_shared<satp::core::TransferStateMachine>(fx.store, ledgers, fx.policy, fx.clock, fx.sleeper);
  auto manager = MakeManager(fx, machine);
  fx.Seed(TransferFixture::NewSession("s-contested"));

  // the transfer starts while Deliver looks the session up
  std::future<satp::model::SessionData> running;
  repository->BeforeNextGet([&] { running = manager->Transfer(TransferFixture::NewSession("s-contested")); });

  assert(manager->Deliver({"s-contested", CounterpartyMessage::Type::kAbort, "counterparty gave up"}));
  gate->Release();

  bool aborted = false;
  try {
    running.get();
  } catch (const satp::util::TransactError& e) {
    aborted = e.Kind() == ErrorKind::kAborted && e.Status() == SessionStatus::kRolledBack;
  }
  assert(aborted);
  assert(fx.source->InvokeCount("lock") == 0 || fx.source->InvokeCount("unlock") == 1);
  assert(fx.source->BalanceOf("alice") == 100);
}

void TestResumeDeliveredToIdleSession() {
  TransferFixture fx;
  auto            manager = MakeManager(fx);
  fx.Seed(TransferFixture::NewSession("s-wake"));

  assert(manager->Deliver({"s-wake", CounterpartyMessage::Type::kResume, ""}));
  auto done = satp::testing::WaitForTerminal(*fx.store, "s-wake");
  assert(done.status == SessionStatus::kSuccess);
}

void TestEmptySessionIdIsRejected() {
  TransferFixture fx;
  auto            manager = MakeManager(fx);

  bool rejected = false;
  try {
    manager->Transfer(TransferFixture::NewSession(""));
  } catch (const satp::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestCompletedSessionIsNotReExecuted();
  TestSecondCallerIsBusyWhileExecuting();
  TestExhaustedSessionStaysInspectableUntilRemoved();
  TestSessionsRunIndependently();
  TestShutdownThenRecovery();
  TestAbortDeliveredToIdleSessionRollsBack();
  TestAbortRacingTransferIsHonoured();
  TestResumeDeliveredToIdleSession();
  TestEmptySessionIdIsRejected();

  std::cout << "satp_manager_test: pass\n";
  return 0;
}
