#include "internal/ledger/connector_ledger_adapter.hpp"

#include "internal/store/session_codec.hpp"
#include "internal/util/errors.hpp"

namespace satp::ledger {

namespace pb = satp::gateway::v1;

namespace {

bool IsRetryable(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::ABORTED:
      return true;
    default:
      return false;
  }
}

void ThrowIfFailed(const ::grpc::Status& status, const std::string& what) {
  if (status.ok()) {
    return;
  }
  throw util::LedgerInvocationError(what + ": " + status.error_message(), IsRetryable(status.error_code()));
}

// Static approve addresses from configuration, when the ledger kind has one.
std::string ConfiguredApproveAddress(const model::NetworkOptions& options) {
  if (const auto* fabric = std::get_if<model::FabricOptions>(&options.ledger)) return fabric->bridge_msp_id;
  if (const auto* besu = std::get_if<model::BesuOptions>(&options.ledger)) return besu->wrapper_contract_address;
  if (const auto* eth = std::get_if<model::EthereumOptions>(&options.ledger)) return eth->wrapper_contract_address;
  return {};
}

} // namespace

std::string ConnectorLedgerAdapter::Endpoint(const model::NetworkOptions& options) {
  return std::visit([](const auto& ledger) -> std::string {
    if constexpr (requires { ledger.connector_endpoint; }) {
      return ledger.connector_endpoint;
    } else {
      return {};
    }
  }, options.ledger);
}

ConnectorLedgerAdapter::ConnectorLedgerAdapter(model::NetworkOptions options)
    : ConnectorLedgerAdapter(options, ::grpc::CreateChannel(Endpoint(options), ::grpc::InsecureChannelCredentials())) {
}

ConnectorLedgerAdapter::ConnectorLedgerAdapter(model::NetworkOptions options, std::shared_ptr<::grpc::Channel> channel)
    : options_(std::move(options)), stub_(pb::LedgerConnectorService::NewStub(std::move(channel))) {
}

void ConnectorLedgerAdapter::Prepare(::grpc::ClientContext& ctx) const {
  ctx.set_deadline(std::chrono::system_clock::now() + options_.request_timeout);
}

InvokeResult ConnectorLedgerAdapter::Invoke(const InvokeRequest& request) {
  pb::ConnectorInvokeRequest req;
  *req.mutable_network() = store::ToProto(request.network);
  req.set_contract(request.contract);
  req.set_method(request.method);
  for (const auto& param : request.params) {
    req.add_params(param);
  }
  req.set_signing_account(request.signing_account);
  req.set_idempotency_key(request.idempotency_key);

  ::grpc::ClientContext       ctx;
  pb::ConnectorInvokeResponse resp;
  Prepare(ctx);
  ThrowIfFailed(stub_->Invoke(&ctx, req, &resp), options_.id + ": invoke " + request.method);

  if (!resp.success()) {
    throw util::LedgerInvocationError(options_.id + ": " + request.method + " failed: " + resp.error(), resp.retryable());
  }
  return {resp.transaction_id(), resp.block_number()};
}

std::string ConnectorLedgerAdapter::Query(const QueryRequest& request) {
  pb::ConnectorQueryRequest req;
  *req.mutable_network() = store::ToProto(request.network);
  req.set_contract(request.contract);
  req.set_method(request.method);
  for (const auto& param : request.params) {
    req.add_params(param);
  }

  ::grpc::ClientContext      ctx;
  pb::ConnectorQueryResponse resp;
  Prepare(ctx);
  ThrowIfFailed(stub_->Query(&ctx, req, &resp), options_.id + ": query " + request.method);
  return resp.value();
}

std::string ConnectorLedgerAdapter::GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) {
  if (auto configured = ConfiguredApproveAddress(options_); !configured.empty()) {
    return configured;
  }

  pb::ConnectorApproveAddressRequest req;
  *req.mutable_network() = store::ToProto(network);
  req.set_token_type(static_cast<pb::TokenType>(token_type));

  ::grpc::ClientContext               ctx;
  pb::ConnectorApproveAddressResponse resp;
  Prepare(ctx);
  ThrowIfFailed(stub_->GetApproveAddress(&ctx, req, &resp), options_.id + ": approve address");
  return resp.approve_address();
}

} // namespace satp::ledger
