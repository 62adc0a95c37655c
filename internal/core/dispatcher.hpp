#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/satp_manager.hpp"
#include "internal/ledger/ledger_registry.hpp"
#include "internal/model/gateway_identity.hpp"
#include "internal/model/session.hpp"
#include "internal/store/session_store.hpp"

namespace satp::core {

/*
  Client-facing request shape. The bounds stay strings here exactly as
  they arrive; an empty string selects the configured default.
*/
struct TransactRequest {
  std::string      context_id;
  model::NetworkId source_network;
  model::NetworkId destination_network;
  model::Asset     source_asset;
  model::Asset     destination_asset;
  uint64_t         amount = 0;
  std::string      max_retries;
  std::string      max_timeout_ms;
};

struct TransactResponse {
  model::SessionStatus status_response = model::SessionStatus::kUnspecified;
  std::string          session_id;
  model::Stage         stage = model::Stage::kUnspecified;
};

struct SessionStatusView {
  model::SessionData session;
  bool               active = false;
};

/*
  Dispatcher

  Entry point behind the gateway API. Validates requests, builds the
  session and waits for the manager to finish it.

  Every Transact failure is a util::TransactError; request validation
  problems carry ErrorKind::kInvalidRequest and never touch the store.
*/
class Dispatcher {
 public:
  struct Defaults {
    uint32_t                  max_retries = 5;
    std::chrono::milliseconds max_timeout{60000};
  };

  Dispatcher(std::shared_ptr<SatpManager> manager, std::shared_ptr<store::SessionStore> store, std::shared_ptr<ledger::LedgerRegistry> ledgers,
             model::GatewayIdentity identity, Defaults defaults);

  TransactResponse Transact(const TransactRequest& request);

  std::string GetApproveAddress(const model::NetworkId& network, model::TokenType token_type);

  SessionStatusView               GetStatus(const std::string& session_id);
  std::vector<model::SessionData> ListSessions(bool include_terminal);

  // false when the session exists but could not take the abort
  bool AbortTransfer(const std::string& session_id, const std::string& reason);

  const model::GatewayIdentity& Identity() const;
  std::vector<model::NetworkId> ConnectedNetworks() const;

  std::size_t RecoverPendingSessions();

 private:
  model::SessionData BuildSession(const TransactRequest& request, const std::string& session_id) const;

  std::shared_ptr<SatpManager>            manager_;
  std::shared_ptr<store::SessionStore>    store_;
  std::shared_ptr<ledger::LedgerRegistry> ledgers_;
  model::GatewayIdentity                  identity_;
  Defaults                                defaults_;
};

} // namespace satp::core
