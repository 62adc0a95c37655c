#include "internal/service/gateway_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/core/dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/session_codec.hpp"
#include "internal/util/errors.hpp"

namespace satp::service {

using namespace satp::gateway::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view session_id, Fn&& fn) {
  satp::observability::SpanScope span(route);
  if (!session_id.empty()) {
    span.SetAttribute("satp.session_id", session_id);
  }

  auto&      metrics    = satp::observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SATP_LOG_ERROR("RPC failed", {satp::observability::StringField("route", route), satp::observability::StringField("session_id", session_id),
                                  satp::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

} // namespace

GatewayService::GatewayService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

TransactResponse GatewayService::Transact(const TransactRequest& req) {
  return ObserveRpc("satp.Transact", req.context_id(), [&] {
    core::TransactRequest request;
    request.context_id          = req.context_id();
    request.source_network      = store::FromProto(req.source_network());
    request.destination_network = store::FromProto(req.destination_network());
    request.source_asset        = store::FromProto(req.source_asset());
    request.destination_asset   = store::FromProto(req.destination_asset());
    request.amount              = req.amount();
    request.max_retries         = req.max_retries();
    request.max_timeout_ms      = req.max_timeout_ms();

    const auto result = ctx_.dispatcher->Transact(request);

    TransactResponse resp;
    resp.set_status_response(static_cast<SessionStatus>(result.status_response));
    resp.set_session_id(result.session_id);
    resp.set_stage(static_cast<Stage>(result.stage));
    return resp;
  });
}

GetApproveAddressResponse GatewayService::GetApproveAddress(const GetApproveAddressRequest& req) {
  return ObserveRpc("satp.GetApproveAddress", "", [&] {
    if (req.network_id().id().empty()) {
      throw util::InvalidArgument("network_id is required");
    }
    GetApproveAddressResponse resp;
    resp.set_approve_address(
        ctx_.dispatcher->GetApproveAddress(store::FromProto(req.network_id()), static_cast<model::TokenType>(req.token_type())));
    return resp;
  });
}

GetStatusResponse GatewayService::GetStatus(const GetStatusRequest& req) {
  return ObserveRpc("satp.GetStatus", req.session_id(), [&] {
    if (req.session_id().empty()) {
      throw util::InvalidArgument("session_id is required");
    }
    const auto view = ctx_.dispatcher->GetStatus(req.session_id());

    GetStatusResponse resp;
    *resp.mutable_session() = store::ToProto(view.session);
    resp.set_active(view.active);
    return resp;
  });
}

ListSessionsResponse GatewayService::ListSessions(const ListSessionsRequest& req) {
  return ObserveRpc("satp.ListSessions", "", [&] {
    ListSessionsResponse resp;
    for (const auto& session : ctx_.dispatcher->ListSessions(req.include_terminal())) {
      *resp.add_sessions() = store::ToProto(session);
    }
    return resp;
  });
}

AbortTransferResponse GatewayService::AbortTransfer(const AbortTransferRequest& req) {
  return ObserveRpc("satp.AbortTransfer", req.session_id(), [&] {
    AbortTransferResponse resp;
    resp.set_accepted(ctx_.dispatcher->AbortTransfer(req.session_id(), req.reason()));
    return resp;
  });
}

satp::gateway::v1::GatewayIdentity GatewayService::GetIdentity(const GetIdentityRequest&) {
  return ObserveRpc("satp.GetIdentity", "", [&] {
    const auto& identity = ctx_.dispatcher->Identity();

    satp::gateway::v1::GatewayIdentity resp;
    resp.set_id(identity.id);
    resp.set_name(identity.name);
    for (const auto& version : identity.version) {
      auto* out = resp.add_version();
      out->set_core(version.core);
      out->set_architecture(version.architecture);
      out->set_crash(version.crash);
    }
    resp.set_proof_id(identity.proof_id);
    resp.set_address(identity.address);
    resp.set_gateway_server_port(identity.gateway_server_port);
    resp.set_gateway_client_port(identity.gateway_client_port);
    for (const auto& network : ctx_.dispatcher->ConnectedNetworks()) {
      *resp.add_connected_networks() = store::ToProto(network);
    }
    return resp;
  });
}

} // namespace satp::service
