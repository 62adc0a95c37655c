#include "internal/grpc/gateway_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace satp::grpc {

using namespace satp::gateway::v1;

GatewayServer::GatewayServer(std::shared_ptr<satp::service::GatewayService> svc) : service_(std::move(svc)) {
}

::grpc::Status GatewayServer::Transact(::grpc::ServerContext*, const TransactRequest* req, TransactResponse* resp) {
  try {
    *resp = service_->Transact(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::GetApproveAddress(::grpc::ServerContext*, const GetApproveAddressRequest* req, GetApproveAddressResponse* resp) {
  try {
    *resp = service_->GetApproveAddress(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::ListSessions(::grpc::ServerContext*, const ListSessionsRequest* req, ListSessionsResponse* resp) {
  try {
    *resp = service_->ListSessions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::AbortTransfer(::grpc::ServerContext*, const AbortTransferRequest* req, AbortTransferResponse* resp) {
  try {
    *resp = service_->AbortTransfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GatewayServer::GetIdentity(::grpc::ServerContext*, const GetIdentityRequest* req, GatewayIdentity* resp) {
  try {
    *resp = service_->GetIdentity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace satp::grpc
