#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/ledger/ledger_adapter.hpp"
#include "internal/model/ledger_options.hpp"
#include "satp/gateway/v1/connector_service.grpc.pb.h"

namespace satp::ledger {

/*
  Adapter for an out-of-process ledger connector speaking
  satp.gateway.v1.LedgerConnectorService. The connector owns the Fabric or
  EVM SDK; this side only maps requests and classifies failures.

  UNAVAILABLE, DEADLINE_EXCEEDED, RESOURCE_EXHAUSTED and ABORTED are
  retryable; every other non-OK status is not.
*/
class ConnectorLedgerAdapter final : public LedgerAdapter {
 public:
  explicit ConnectorLedgerAdapter(model::NetworkOptions options);
  ConnectorLedgerAdapter(model::NetworkOptions options, std::shared_ptr<::grpc::Channel> channel);

  InvokeResult Invoke(const InvokeRequest& request) override;
  std::string  Query(const QueryRequest& request) override;
  std::string  GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) override;

  static std::string Endpoint(const model::NetworkOptions& options);

 private:
  void Prepare(::grpc::ClientContext& ctx) const;

  model::NetworkOptions                                                options_;
  std::unique_ptr<satp::gateway::v1::LedgerConnectorService::Stub> stub_;
};

} // namespace satp::ledger
