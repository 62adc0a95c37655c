#include "internal/core/transfer_state_machine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace satp::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCancelledMessage = "gateway is shutting down";

// Balances wider than 64 bits (wei-denominated ERC20) cover any amount,
// so they saturate.
uint64_t ParseBalance(const std::string& answer, const std::string& network) {
  if (answer.empty() || !std::all_of(answer.begin(), answer.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw util::LedgerInvocationError(network + ": unreadable balance '" + answer + "'", false);
  }
  uint64_t   balance = 0;
  const auto parsed  = std::from_chars(answer.data(), answer.data() + answer.size(), balance);
  if (parsed.ec == std::errc::result_out_of_range) {
    return std::numeric_limits<uint64_t>::max();
  }
  return balance;
}

// Anything an adapter throws outside the domain errors is a ledger failure
// that retrying will not fix.
template <typename Fn>
auto AsLedgerFailure(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::LedgerInvocationError&) {
    throw;
  } catch (const util::InvalidStateError&) {
    throw;
  } catch (const util::CancelledError&) {
    throw;
  } catch (const util::PersistenceError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::LedgerInvocationError(std::string("unexpected ledger failure: ") + e.what(), false);
  }
}

bool InHistory(const model::SessionData& session, model::Stage stage) {
  return std::find(session.stage_history.begin(), session.stage_history.end(), stage) != session.stage_history.end();
}

bool HasReceipt(const model::SessionData& session, model::Stage stage, ledger::Operation op, const model::NetworkId& network) {
  return std::any_of(session.receipts.begin(), session.receipts.end(), [&](const model::Receipt& receipt) {
    return receipt.stage == stage && receipt.operation == ledger::OperationName(op) && receipt.network_id.id == network.id;
  });
}

double MillisSince(retry::Clock::TimePoint start, retry::Clock::TimePoint now) {
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // namespace

TransferStateMachine::TransferStateMachine(std::shared_ptr<store::SessionStore> store, std::shared_ptr<ledger::LedgerRegistry> ledgers,
                                           std::shared_ptr<retry::RetryPolicy> policy, std::shared_ptr<retry::Clock> clock,
                                           std::shared_ptr<retry::Sleeper> sleeper)
    : store_(std::move(store)),
      ledgers_(std::move(ledgers)),
      policy_(std::move(policy)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
}

model::SessionData TransferStateMachine::Run(const std::string& session_id, const AbortCheck& abort_requested) {
  observability::SpanScope span("satp.transfer");
  span.SetAttribute("satp.session_id", session_id);

  model::SessionData session;
  try {
    session = store_->Get(session_id);
    if (!model::IsTerminal(session.status)) {
      SATP_LOG_INFO("transfer started", {StringField("session_id", session_id), StringField("stage", model::StageName(session.stage))});
      session = Drive(std::move(session), abort_requested);
    }
  } catch (const util::CancelledError& e) {
    SATP_LOG_INFO("transfer suspended", {StringField("session_id", session_id), StringField("reason", e.what())});
    span.AddEvent("cancelled");
    throw util::TransactError(session_id, model::ErrorKind::kCancelled, model::SessionStatus::kInProgress, e.what());
  } catch (const util::NotFound& e) {
    span.RecordException(e.what());
    throw util::TransactError(session_id, model::ErrorKind::kInvalidState, model::SessionStatus::kUnspecified, e.what());
  } catch (const util::InvalidStateError& e) {
    SATP_LOG_ERROR("transfer halted on state mismatch", {StringField("session_id", session_id), StringField("error", e.what())});
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordTransfer("invalid_state");
    throw util::TransactError(session_id, model::ErrorKind::kInvalidState, model::SessionStatus::kInProgress, e.what());
  } catch (const util::PersistenceError& e) {
    SATP_LOG_ERROR("transfer halted on persistence failure", {StringField("session_id", session_id), StringField("error", e.what())});
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordTransfer("persistence_error");
    throw util::TransactError(session_id, model::ErrorKind::kPersistence, model::SessionStatus::kInProgress, e.what());
  } catch (const std::exception& e) {
    SATP_LOG_ERROR("transfer halted on unexpected error", {StringField("session_id", session_id), StringField("error", e.what())});
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordTransfer("invalid_state");
    throw util::TransactError(session_id, model::ErrorKind::kInvalidState, model::SessionStatus::kInProgress, e.what());
  }

  span.SetAttribute("satp.status", model::SessionStatusName(session.status));
  return Finish(session);
}

model::SessionData TransferStateMachine::Finish(const model::SessionData& session) {
  switch (session.status) {
    case model::SessionStatus::kSuccess:
      return session;
    case model::SessionStatus::kRolledBack:
      throw util::TransactError(session.session_id, session.last_error.kind, session.status, session.last_error.message);
    case model::SessionStatus::kFailed:
      throw util::TransactError(session.session_id, model::ErrorKind::kCompensationFailed, session.status, session.last_error.message);
    default:
      throw util::TransactError(session.session_id, model::ErrorKind::kInvalidState, session.status, "session did not reach a terminal status");
  }
}

model::SessionData TransferStateMachine::Drive(model::SessionData session, const AbortCheck& abort_requested) {
  // a session picked up mid-flight may have an ambiguous submission behind it
  bool resumed = session.stage != model::Stage::kInitiated || session.attempt_count > 0;

  while (session.status == model::SessionStatus::kInProgress) {
    if (session.stage == model::Stage::kRollbackPending) {
      session = Compensate(std::move(session), resumed);
    } else if (session.abort_requested || (abort_requested && abort_requested())) {
      session = EnterRollback(std::move(session), {model::ErrorKind::kAborted, "transfer aborted by counterparty gateway"});
    } else {
      session = ExecuteStage(std::move(session), resumed);
    }
    resumed = false;
  }

  auto& metrics = observability::Metrics::Instance();
  if (session.status == model::SessionStatus::kSuccess) {
    SATP_LOG_INFO("transfer completed", {StringField("session_id", session.session_id), IntField("receipts", session.receipts.size())});
    metrics.RecordTransfer("success");
  } else if (session.status == model::SessionStatus::kRolledBack) {
    SATP_LOG_WARN("transfer rolled back",
                  {StringField("session_id", session.session_id), StringField("cause", model::ErrorKindName(session.last_error.kind)),
                   StringField("error", session.last_error.message)});
    metrics.RecordTransfer("rolled_back");
  } else {
    SATP_LOG_ERROR("transfer failed, manual intervention required",
                   {StringField("session_id", session.session_id), StringField("error", session.last_error.message)});
    metrics.RecordTransfer("failed");
  }
  return session;
}

model::SessionData TransferStateMachine::ExecuteStage(model::SessionData session, bool resumed) {
  const auto stage      = session.stage;
  const auto stage_name = model::StageName(stage);
  const auto entered    = clock_->Now();

  observability::SpanScope span(std::string("satp.stage.") + stage_name);
  span.SetAttribute("satp.session_id", session.session_id);

  auto& metrics = observability::Metrics::Instance();
  bool  probe   = resumed;

  while (true) {
    if (sleeper_->Cancelled()) {
      throw util::CancelledError(kCancelledMessage);
    }
    session = Reload(session);

    try {
      auto receipt = AsLedgerFailure([&] { return PerformStage(session, probe); });
      metrics.RecordStageAttempt(stage_name, true);
      metrics.ObserveStageLatencyMs(stage_name, MillisSince(entered, clock_->Now()));
      SATP_LOG_DEBUG("stage done", {StringField("session_id", session.session_id), StringField("stage", stage_name),
                                    BoolField("recovered", receipt && receipt->recovered)});
      return Advance(std::move(session), std::move(receipt));
    } catch (const util::LedgerInvocationError& e) {
      metrics.RecordStageAttempt(stage_name, false);
      span.RecordException(e.what());

      session.attempt_count++;
      session.last_error = {model::ErrorKind::kLedgerInvocation, e.what()};
      session            = store_->Put(session);

      SATP_LOG_WARN("stage attempt failed", {StringField("session_id", session.session_id), StringField("stage", stage_name),
                                             IntField("attempt", session.attempt_count), BoolField("retryable", e.Retryable()),
                                             StringField("error", e.what())});

      auto reason = session.last_error;
      if (!e.Retryable()) {
        return EnterRollback(std::move(session), std::move(reason));
      }

      const auto elapsed  = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->Now() - entered);
      const auto decision = policy_->Decide({session.attempt_count, session.max_retries, session.max_timeout, elapsed});
      if (!decision.ShouldRetry()) {
        return EnterRollback(std::move(session), std::move(reason));
      }
      if (!sleeper_->Sleep(decision.delay)) {
        throw util::CancelledError(kCancelledMessage);
      }
      probe = true;
    }
  }
}

std::optional<model::Receipt> TransferStateMachine::PerformStage(model::SessionData& session, bool probe) {
  switch (session.stage) {
    case model::Stage::kInitiated: {
      const auto& source   = Network(session.source_network);
      const auto  answer   = source.adapter->Query(ledger::AssetProtocol::BalanceOf(source.options, session.source_asset, session.source_asset.owner));
      const auto  balance  = ParseBalance(answer, session.source_network.id);
      const auto  required = ledger::AssetProtocol::IsNonFungible(session.source_asset.token_type) ? uint64_t{1} : session.amount;
      if (balance < required) {
        throw util::LedgerInvocationError("insufficient balance for " + session.source_asset.owner + " on " + session.source_network.id + ": has " +
                                              std::to_string(balance) + ", needs " + std::to_string(required),
                                          false);
      }
      return std::nullopt;
    }
    case model::Stage::kSourceLockPending:
      return ConfirmedAction(ledger::Operation::kLock, session.source_network, session.source_asset, session.source_asset.owner, session,
                             session.stage, probe);
    case model::Stage::kSourceLockConfirmed: {
      const auto& destination = Network(session.destination_network);
      try {
        session.approve_address = destination.adapter->GetApproveAddress(session.destination_network, session.destination_asset.token_type);
      } catch (const util::InvalidArgument& e) {
        throw util::LedgerInvocationError(e.what(), false);
      }
      return std::nullopt;
    }
    case model::Stage::kDestinationMintPending:
      return ConfirmedAction(ledger::Operation::kMint, session.destination_network, session.destination_asset, session.destination_asset.owner,
                             session, session.stage, probe);
    case model::Stage::kDestinationMintConfirmed: {
      const auto& source = Network(session.source_network);
      std::string escrow;
      try {
        escrow = source.adapter->GetApproveAddress(session.source_network, session.source_asset.token_type);
      } catch (const util::InvalidArgument& e) {
        throw util::LedgerInvocationError(e.what(), false);
      }
      return ConfirmedAction(ledger::Operation::kBurn, session.source_network, session.source_asset, escrow, session, session.stage, probe);
    }
    default:
      throw util::InvalidStateError(std::string("no forward action for stage ") + model::StageName(session.stage));
  }
}

model::SessionData TransferStateMachine::Advance(model::SessionData session, std::optional<model::Receipt> receipt) {
  const auto next = model::NextStage(session.stage);
  if (!next || !model::CanTransition(session.stage, *next)) {
    throw util::InvalidStateError(std::string("cannot advance from ") + model::StageName(session.stage));
  }

  if (receipt) {
    session.receipts.push_back(std::move(*receipt));
  }
  session.stage = *next;
  session.stage_history.push_back(*next);
  session.attempt_count = 0;
  session.last_error    = {};
  if (*next == model::Stage::kCompleted) {
    session.status = model::SessionStatus::kSuccess;
  }
  return store_->Put(session);
}

model::SessionData TransferStateMachine::EnterRollback(model::SessionData session, model::SessionError reason) {
  if (!model::CanTransition(session.stage, model::Stage::kRollbackPending)) {
    throw util::InvalidStateError(std::string("cannot roll back from ") + model::StageName(session.stage));
  }

  SATP_LOG_WARN("entering rollback", {StringField("session_id", session.session_id), StringField("from", model::StageName(session.stage)),
                                      StringField("cause", model::ErrorKindName(reason.kind)), StringField("error", reason.message)});

  session.stage = model::Stage::kRollbackPending;
  session.stage_history.push_back(model::Stage::kRollbackPending);
  session.attempt_count = 0;
  session.last_error    = std::move(reason);
  return store_->Put(session);
}

model::SessionData TransferStateMachine::Compensate(model::SessionData session, bool resumed) {
  // last_error keeps the rollback cause while compensation runs
  const auto reason  = session.last_error;
  const auto entered = clock_->Now();

  observability::SpanScope span("satp.stage.ROLLBACK_PENDING");
  span.SetAttribute("satp.session_id", session.session_id);

  auto& metrics = observability::Metrics::Instance();
  bool  probe   = resumed;

  while (true) {
    if (sleeper_->Cancelled()) {
      throw util::CancelledError(kCancelledMessage);
    }
    session = Reload(session);

    try {
      AsLedgerFailure([&] { Undo(session, probe); });
      metrics.RecordStageAttempt("ROLLBACK_PENDING", true);

      session.stage = model::Stage::kRolledBack;
      session.stage_history.push_back(model::Stage::kRolledBack);
      session.status        = model::SessionStatus::kRolledBack;
      session.attempt_count = 0;
      session.last_error    = reason;
      return store_->Put(session);
    } catch (const util::LedgerInvocationError& e) {
      metrics.RecordStageAttempt("ROLLBACK_PENDING", false);
      span.RecordException(e.what());
      session.attempt_count++;

      SATP_LOG_WARN("compensation attempt failed", {StringField("session_id", session.session_id), IntField("attempt", session.attempt_count),
                                                    StringField("error", e.what())});

      const auto elapsed  = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->Now() - entered);
      const auto decision = policy_->Decide({session.attempt_count, session.max_retries, session.max_timeout, elapsed});
      if (!e.Retryable() || !decision.ShouldRetry()) {
        session.status     = model::SessionStatus::kFailed;
        session.last_error = {model::ErrorKind::kCompensationFailed,
                              "compensation failed (" + std::string(e.what()) + ") after " + reason.message +
                                  "; assets may be held in escrow, manual intervention required"};
        return store_->Put(session);
      }

      // receipts of compensating actions that already landed are kept
      session = store_->Put(session);
      if (!sleeper_->Sleep(decision.delay)) {
        throw util::CancelledError(kCancelledMessage);
      }
      probe = true;
    }
  }
}

void TransferStateMachine::Undo(model::SessionData& session, bool probe) {
  const auto rollback = model::Stage::kRollbackPending;

  // minted units come back from the recipient first
  if (Landed(session, ledger::Operation::kMint, model::Stage::kDestinationMintPending, session.destination_network, session.destination_asset) &&
      !HasReceipt(session, rollback, ledger::Operation::kBurn, session.destination_network)) {
    session.receipts.push_back(ConfirmedAction(ledger::Operation::kBurn, session.destination_network, session.destination_asset,
                                               session.destination_asset.owner, session, rollback, probe));
  }

  // escrow already burned on the source: re-issue to the owner
  if (Landed(session, ledger::Operation::kBurn, model::Stage::kDestinationMintConfirmed, session.source_network, session.source_asset)) {
    if (!HasReceipt(session, rollback, ledger::Operation::kMint, session.source_network)) {
      session.receipts.push_back(ConfirmedAction(ledger::Operation::kMint, session.source_network, session.source_asset, session.source_asset.owner,
                                                 session, rollback, probe));
    }
    return;
  }

  if (Landed(session, ledger::Operation::kLock, model::Stage::kSourceLockPending, session.source_network, session.source_asset) &&
      !HasReceipt(session, rollback, ledger::Operation::kUnlock, session.source_network)) {
    session.receipts.push_back(ConfirmedAction(ledger::Operation::kUnlock, session.source_network, session.source_asset, session.source_asset.owner,
                                               session, rollback, probe));
  }
}

bool TransferStateMachine::Landed(const model::SessionData& session, ledger::Operation op, model::Stage stage, const model::NetworkId& network,
                                  const model::Asset& asset) {
  if (const auto* receipt = model::FindReceipt(session, stage); receipt && receipt->operation == ledger::OperationName(op)) {
    return true;
  }
  // never attempted
  if (!InHistory(session, stage)) {
    return false;
  }
  return Probe(op, network, asset, session.session_id).has_value();
}

model::Receipt TransferStateMachine::ConfirmedAction(ledger::Operation op, const model::NetworkId& network, const model::Asset& asset,
                                                     const std::string& account, const model::SessionData& session, model::Stage receipt_stage,
                                                     bool probe) {
  model::Receipt receipt;
  receipt.stage      = receipt_stage;
  receipt.operation  = ledger::OperationName(op);
  receipt.network_id = network;

  if (probe) {
    if (auto landed = Probe(op, network, asset, session.session_id)) {
      SATP_LOG_INFO("operation already on ledger", {StringField("session_id", session.session_id), StringField("operation", receipt.operation),
                                                    StringField("network", network.id), StringField("tx", *landed)});
      receipt.transaction_id  = *landed;
      receipt.recovered       = true;
      receipt.confirmed_at_ms = util::NowMillis();
      return receipt;
    }
  }

  const auto& entry  = Network(network);
  const auto  result = entry.adapter->Invoke(ledger::AssetProtocol::Action(op, entry.options, asset, account, session.amount, session.session_id));

  receipt.transaction_id  = result.transaction_id;
  receipt.block_number    = result.block_number;
  receipt.confirmed_at_ms = util::NowMillis();
  return receipt;
}

std::optional<std::string> TransferStateMachine::Probe(ledger::Operation op, const model::NetworkId& network, const model::Asset& asset,
                                                       const std::string& session_id) {
  const auto& entry = Network(network);
  return ledger::AssetProtocol::ParseReceipt(entry.adapter->Query(ledger::AssetProtocol::OperationReceipt(op, entry.options, asset, session_id)));
}

const ledger::LedgerRegistry::Entry& TransferStateMachine::Network(const model::NetworkId& network) const {
  try {
    return ledgers_->Get(network);
  } catch (const util::InvalidArgument& e) {
    throw util::LedgerInvocationError(e.what(), false);
  }
}

model::SessionData TransferStateMachine::Reload(const model::SessionData& expected) {
  auto current = store_->Get(expected.session_id);
  if (current.stage != expected.stage || current.version != expected.version) {
    throw util::InvalidStateError("session " + expected.session_id + " changed underneath: expected " + model::StageName(expected.stage) + "@v" +
                                  std::to_string(expected.version) + ", found " + model::StageName(current.stage) + "@v" +
                                  std::to_string(current.version));
  }
  return current;
}

} // namespace satp::core
