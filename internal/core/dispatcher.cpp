#include "internal/core/dispatcher.hpp"

#include <limits>

#include "internal/ledger/asset_protocol.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/session_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace satp::core {

using observability::StringField;

namespace {

void RequireAsset(const model::Asset& asset, const char* side) {
  if (asset.id.empty()) {
    throw util::InvalidArgument(std::string(side) + " asset id is required");
  }
  if (asset.owner.empty()) {
    throw util::InvalidArgument(std::string(side) + " asset owner is required");
  }
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<SatpManager> manager, std::shared_ptr<store::SessionStore> store,
                       std::shared_ptr<ledger::LedgerRegistry> ledgers, model::GatewayIdentity identity, Defaults defaults)
    : manager_(std::move(manager)),
      store_(std::move(store)),
      ledgers_(std::move(ledgers)),
      identity_(std::move(identity)),
      defaults_(defaults) {
}

model::SessionData Dispatcher::BuildSession(const TransactRequest& request, const std::string& session_id) const {
  // both throw InvalidArgument for unknown or mistyped networks
  ledgers_->Get(request.source_network);
  ledgers_->Get(request.destination_network);
  if (request.source_network.id == request.destination_network.id) {
    throw util::InvalidArgument("source and destination network must differ");
  }

  RequireAsset(request.source_asset, "source");
  RequireAsset(request.destination_asset, "destination");

  const bool non_fungible = ledger::AssetProtocol::IsNonFungible(request.source_asset.token_type);
  if (request.amount == 0 && !non_fungible) {
    throw util::InvalidArgument("amount must be positive");
  }

  model::SessionData session;
  session.session_id          = session_id;
  session.source_network      = request.source_network;
  session.destination_network = request.destination_network;
  session.source_asset        = request.source_asset;
  session.destination_asset   = request.destination_asset;
  session.amount              = non_fungible ? 1 : request.amount;

  if (session.source_asset.network_id.id.empty()) session.source_asset.network_id = request.source_network;
  if (session.destination_asset.network_id.id.empty()) session.destination_asset.network_id = request.destination_network;

  session.max_retries = defaults_.max_retries;
  if (!request.max_retries.empty()) {
    const auto retries = store::ParseUnsigned("max_retries", request.max_retries);
    if (retries == 0 || retries > std::numeric_limits<uint32_t>::max()) {
      throw util::InvalidArgument("max_retries must be between 1 and " + std::to_string(std::numeric_limits<uint32_t>::max()));
    }
    session.max_retries = static_cast<uint32_t>(retries);
  }

  session.max_timeout = defaults_.max_timeout;
  if (!request.max_timeout_ms.empty()) {
    const auto timeout = store::ParseUnsigned("max_timeout_ms", request.max_timeout_ms);
    if (timeout > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw util::InvalidArgument("max_timeout_ms out of range");
    }
    session.max_timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout));
  }
  return session;
}

TransactResponse Dispatcher::Transact(const TransactRequest& request) {
  const auto session_id = request.context_id.empty() ? util::NewSessionId() : request.context_id;

  std::future<model::SessionData> pending;
  try {
    pending = manager_->Transfer(BuildSession(request, session_id));
  } catch (const util::InvalidArgument& e) {
    SATP_LOG_WARN("transact rejected", {StringField("session_id", session_id), StringField("error", e.what())});
    throw util::TransactError(session_id, model::ErrorKind::kInvalidRequest, model::SessionStatus::kUnspecified, e.what());
  } catch (const util::SessionBusyError& e) {
    throw util::TransactError(session_id, model::ErrorKind::kSessionBusy, model::SessionStatus::kInProgress, e.what());
  }

  const auto session = pending.get();

  TransactResponse response;
  response.status_response = session.status;
  response.session_id      = session.session_id;
  response.stage           = session.stage;
  return response;
}

std::string Dispatcher::GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) {
  const auto& entry = ledgers_->Get(network);
  return entry.adapter->GetApproveAddress(network, token_type);
}

SessionStatusView Dispatcher::GetStatus(const std::string& session_id) {
  SessionStatusView view;
  view.session = store_->Get(session_id);
  view.active  = manager_->Sessions().IsRunning(session_id);
  return view;
}

std::vector<model::SessionData> Dispatcher::ListSessions(bool include_terminal) {
  return store_->List(include_terminal);
}

bool Dispatcher::AbortTransfer(const std::string& session_id, const std::string& reason) {
  if (session_id.empty()) {
    throw util::InvalidArgument("session_id is required");
  }
  if (!store_->Find(session_id)) {
    throw util::NotFound("session " + session_id + " not found");
  }
  return manager_->Deliver({session_id, CounterpartyMessage::Type::kAbort, reason});
}

const model::GatewayIdentity& Dispatcher::Identity() const {
  return identity_;
}

std::vector<model::NetworkId> Dispatcher::ConnectedNetworks() const {
  return ledgers_->Networks();
}

std::size_t Dispatcher::RecoverPendingSessions() {
  return manager_->RecoverPendingSessions();
}

} // namespace satp::core
