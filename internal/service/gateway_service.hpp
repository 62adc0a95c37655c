#pragma once

#include "internal/service/service_context.hpp"
#include "satp/gateway/v1/gateway_service.pb.h"

namespace satp::service {

/*
  Proto-facing side of the gateway. Converts messages to domain types,
  calls the dispatcher and records per-route spans and metrics.
*/
class GatewayService {
 public:
  explicit GatewayService(ServiceContext ctx);

  satp::gateway::v1::TransactResponse Transact(const satp::gateway::v1::TransactRequest& req);

  satp::gateway::v1::GetApproveAddressResponse GetApproveAddress(const satp::gateway::v1::GetApproveAddressRequest& req);

  satp::gateway::v1::GetStatusResponse GetStatus(const satp::gateway::v1::GetStatusRequest& req);

  satp::gateway::v1::ListSessionsResponse ListSessions(const satp::gateway::v1::ListSessionsRequest& req);

  satp::gateway::v1::AbortTransferResponse AbortTransfer(const satp::gateway::v1::AbortTransferRequest& req);

  satp::gateway::v1::GatewayIdentity GetIdentity(const satp::gateway::v1::GetIdentityRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace satp::service
