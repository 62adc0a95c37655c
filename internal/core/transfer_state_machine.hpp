#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/ledger/asset_protocol.hpp"
#include "internal/ledger/ledger_registry.hpp"
#include "internal/model/session.hpp"
#include "internal/retry/clock.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/store/session_store.hpp"

namespace satp::core {

/*
  Drives one session from its stored stage to a terminal status.

  Each forward stage is one ledger action (see AssetProtocol). A failed
  attempt is persisted before the retry policy is consulted; an abort
  decision, a non-retryable error or a counterparty abort moves the
  session to ROLLBACK_PENDING and compensation undoes whatever landed.

  Before every attempt the session is reloaded and its stage and version
  compared with what this run last wrote. Any difference is an
  InvalidStateError: someone else touched the session.

  Run() returns the session on SUCCESS and throws util::TransactError for
  every other outcome, including cancellation (status stays IN_PROGRESS and
  the session can be resumed).
*/
class TransferStateMachine {
 public:
  using AbortCheck = std::function<bool()>;

  TransferStateMachine(std::shared_ptr<store::SessionStore> store, std::shared_ptr<ledger::LedgerRegistry> ledgers,
                       std::shared_ptr<retry::RetryPolicy> policy, std::shared_ptr<retry::Clock> clock, std::shared_ptr<retry::Sleeper> sleeper);

  model::SessionData Run(const std::string& session_id, const AbortCheck& abort_requested = {});

 private:
  model::SessionData Drive(model::SessionData session, const AbortCheck& abort_requested);
  model::SessionData ExecuteStage(model::SessionData session, bool resumed);
  model::SessionData Advance(model::SessionData session, std::optional<model::Receipt> receipt);
  model::SessionData EnterRollback(model::SessionData session, model::SessionError reason);
  model::SessionData Compensate(model::SessionData session, bool resumed);

  std::optional<model::Receipt> PerformStage(model::SessionData& session, bool probe);
  void                          Undo(model::SessionData& session, bool probe);

  model::Receipt ConfirmedAction(ledger::Operation op, const model::NetworkId& network, const model::Asset& asset, const std::string& account,
                                 const model::SessionData& session, model::Stage receipt_stage, bool probe);
  std::optional<std::string> Probe(ledger::Operation op, const model::NetworkId& network, const model::Asset& asset,
                                   const std::string& session_id);
  bool Landed(const model::SessionData& session, ledger::Operation op, model::Stage stage, const model::NetworkId& network,
              const model::Asset& asset);

  const ledger::LedgerRegistry::Entry& Network(const model::NetworkId& network) const;
  model::SessionData                   Reload(const model::SessionData& expected);
  model::SessionData                   Finish(const model::SessionData& session);

  std::shared_ptr<store::SessionStore>    store_;
  std::shared_ptr<ledger::LedgerRegistry> ledgers_;
  std::shared_ptr<retry::RetryPolicy>     policy_;
  std::shared_ptr<retry::Clock>           clock_;
  std::shared_ptr<retry::Sleeper>         sleeper_;
};

} // namespace satp::core
