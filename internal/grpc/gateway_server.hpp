#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/gateway_service.hpp"
#include "satp/gateway/v1/gateway_service.grpc.pb.h"

namespace satp::grpc {

class GatewayServer final : public satp::gateway::v1::SatpGatewayService::Service {
 public:
  explicit GatewayServer(std::shared_ptr<satp::service::GatewayService> svc);

  ::grpc::Status Transact(::grpc::ServerContext*, const satp::gateway::v1::TransactRequest*, satp::gateway::v1::TransactResponse*) override;

  ::grpc::Status GetApproveAddress(::grpc::ServerContext*, const satp::gateway::v1::GetApproveAddressRequest*,
                                   satp::gateway::v1::GetApproveAddressResponse*) override;

  ::grpc::Status GetStatus(::grpc::ServerContext*, const satp::gateway::v1::GetStatusRequest*, satp::gateway::v1::GetStatusResponse*) override;

  ::grpc::Status ListSessions(::grpc::ServerContext*, const satp::gateway::v1::ListSessionsRequest*,
                              satp::gateway::v1::ListSessionsResponse*) override;

  ::grpc::Status AbortTransfer(::grpc::ServerContext*, const satp::gateway::v1::AbortTransferRequest*,
                               satp::gateway::v1::AbortTransferResponse*) override;

  ::grpc::Status GetIdentity(::grpc::ServerContext*, const satp::gateway::v1::GetIdentityRequest*, satp::gateway::v1::GatewayIdentity*) override;

 private:
  std::shared_ptr<satp::service::GatewayService> service_;
};

} // namespace satp::grpc
