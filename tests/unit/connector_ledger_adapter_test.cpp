#include <grpcpp/grpcpp.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/ledger/asset_protocol.hpp"
#include "internal/ledger/connector_ledger_adapter.hpp"
#include "internal/ledger/simulated_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace pb = satp::gateway::v1;

using satp::ledger::AssetProtocol;
using satp::ledger::ConnectorLedgerAdapter;
using satp::ledger::Operation;

/*
  Connector backed by a SimulatedLedger. Methods named in fail_with answer
  with that status code instead.
*/
class FakeConnector final : public pb::LedgerConnectorService::Service {
 public:
  explicit FakeConnector(std::shared_ptr<satp::ledger::SimulatedLedger> ledger) : ledger_(std::move(ledger)) {
  }

  ::grpc::Status Invoke(::grpc::ServerContext*, const pb::ConnectorInvokeRequest* req, pb::ConnectorInvokeResponse* resp) override {
    if (req->method() == "unavailable") return {::grpc::StatusCode::UNAVAILABLE, "connector restarting"};
    if (req->method() == "denied") return {::grpc::StatusCode::PERMISSION_DENIED, "bad identity"};

    last_key = req->idempotency_key();

    satp::ledger::InvokeRequest request;
    request.network = {req->network().id(), static_cast<satp::model::LedgerType>(req->network().ledger_type())};
    request.method  = req->method();
    request.params.assign(req->params().begin(), req->params().end());
    try {
      auto result = ledger_->Invoke(request);
      resp->set_success(true);
      resp->set_transaction_id(result.transaction_id);
      resp->set_block_number(result.block_number);
    } catch (const satp::util::LedgerInvocationError& e) {
      resp->set_success(false);
      resp->set_retryable(e.Retryable());
      resp->set_error(e.what());
    }
    return ::grpc::Status::OK;
  }

  ::grpc::Status Query(::grpc::ServerContext*, const pb::ConnectorQueryRequest* req, pb::ConnectorQueryResponse* resp) override {
    satp::ledger::QueryRequest request;
    request.method = req->method();
    request.params.assign(req->params().begin(), req->params().end());
    resp->set_value(ledger_->Query(request));
    return ::grpc::Status::OK;
  }

  ::grpc::Status GetApproveAddress(::grpc::ServerContext*, const pb::ConnectorApproveAddressRequest*,
                                   pb::ConnectorApproveAddressResponse* resp) override {
    resp->set_approve_address("0xescrow");
    return ::grpc::Status::OK;
  }

  std::string last_key;

 private:
  std::shared_ptr<satp::ledger::SimulatedLedger> ledger_;
};

satp::model::NetworkOptions Besu(const std::string& wrapper_address) {
  satp::model::BesuOptions besu;
  besu.connector_endpoint       = "in-process";
  besu.wrapper_contract_name    = "SATPWrapperContract";
  besu.wrapper_contract_address = wrapper_address;
  return {"besu-b", std::chrono::milliseconds(5000), besu};
}

satp::model::Asset Token() {
  satp::model::Asset asset;
  asset.id         = "TOKEN";
  asset.token_type = satp::model::TokenType::kErc20;
  return asset;
}

struct Connector {
  Connector() {
    satp::model::SimulatedOptions simulated;
    simulated.balances["0xalice"] = 50;
    ledger  = std::make_shared<satp::ledger::SimulatedLedger>(satp::model::NetworkId{"besu-b", satp::model::LedgerType::kBesu}, simulated);
    service = std::make_unique<FakeConnector>(ledger);

    ::grpc::ServerBuilder builder;
    builder.RegisterService(service.get());
    server = builder.BuildAndStart();
    assert(server != nullptr);
  }

  ~Connector() {
    server->Shutdown();
  }

  std::shared_ptr<::grpc::Channel> Channel() {
    return server->InProcessChannel(::grpc::ChannelArguments());
  }

  std::shared_ptr<satp::ledger::SimulatedLedger> ledger;
  std::unique_ptr<FakeConnector>                 service;
  std::unique_ptr<::grpc::Server>                server;
};

template <typename Fn>
bool FailsWith(Fn&& fn, bool retryable) {
  try {
    fn();
  } catch (const satp::util::LedgerInvocationError& e) {
    return e.Retryable() == retryable;
  }
  return false;
}

void TestInvokeAndProbeThroughConnector() {
  Connector              connector;
  const auto             options = Besu("");
  ConnectorLedgerAdapter adapter(options, connector.Channel());

  auto result = adapter.Invoke(AssetProtocol::Action(Operation::kLock, options, Token(), "0xalice", 20, "s-1"));
  assert(!result.transaction_id.empty());
  assert(connector.service->last_key == "s-1:lock");
  assert(connector.ledger->BalanceOf("0xalice") == 30);

  auto landed = adapter.Query(AssetProtocol::OperationReceipt(Operation::kLock, options, Token(), "s-1"));
  assert(landed == result.transaction_id);
  assert(adapter.Query(AssetProtocol::BalanceOf(options, Token(), "0xalice")) == "30");
}

void TestFailureClassification() {
  Connector              connector;
  const auto             options = Besu("");
  ConnectorLedgerAdapter adapter(options, connector.Channel());

  auto request   = AssetProtocol::Action(Operation::kLock, options, Token(), "0xalice", 20, "s-2");
  request.method = "unavailable";
  assert(FailsWith([&] { adapter.Invoke(request); }, true));

  request.method = "denied";
  assert(FailsWith([&] { adapter.Invoke(request); }, false));

  // the connector answered, but the ledger refused
  auto overdraft = AssetProtocol::Action(Operation::kLock, options, Token(), "0xalice", 500, "s-3");
  assert(FailsWith([&] { adapter.Invoke(overdraft); }, false));
}

void TestApproveAddressPrefersConfiguration() {
  Connector connector;

  ConnectorLedgerAdapter configured(Besu("0xwrapper"), connector.Channel());
  assert(configured.GetApproveAddress({"besu-b", satp::model::LedgerType::kBesu}, satp::model::TokenType::kErc20) == "0xwrapper");

  ConnectorLedgerAdapter asked(Besu(""), connector.Channel());
  assert(asked.GetApproveAddress({"besu-b", satp::model::LedgerType::kBesu}, satp::model::TokenType::kErc20) == "0xescrow");

  assert(ConnectorLedgerAdapter::Endpoint(Besu("")) == "in-process");
}

} // namespace

int main() {
  TestInvokeAndProbeThroughConnector();
  TestFailureClassification();
  TestApproveAddressPrefersConfiguration();

  std::cout << "connector_ledger_adapter_test: pass\n";
  return 0;
}
