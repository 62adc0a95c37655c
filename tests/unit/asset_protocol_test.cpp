#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/ledger/asset_protocol.hpp"

namespace {

using satp::ledger::AssetProtocol;
using satp::ledger::Operation;

satp::model::NetworkOptions Fabric() {
  satp::model::FabricOptions fabric;
  fabric.connector_endpoint = "localhost:7050";
  fabric.contract_name      = "satp-contract";
  fabric.signing_identity   = "bridge-user";
  return {"fabric-a", std::chrono::milliseconds(1000), fabric};
}

satp::model::NetworkOptions Besu() {
  satp::model::BesuOptions besu;
  besu.connector_endpoint    = "localhost:8545";
  besu.wrapper_contract_name = "SATPWrapperContract";
  besu.eth_account           = "0xbridge";
  return {"besu-b", std::chrono::milliseconds(1000), besu};
}

satp::model::Asset Asset(satp::model::TokenType type) {
  satp::model::Asset asset;
  asset.id            = "ExampleAsset";
  asset.owner         = "User_A";
  asset.contract_name = "asset-contract";
  asset.token_type    = type;
  return asset;
}

void TestFabricUsesChaincodeNames() {
  auto request = AssetProtocol::Action(Operation::kLock, Fabric(), Asset(satp::model::TokenType::kNonstandardFungible), "User_A", 25, "s-1");
  assert(request.method == "Lock");
  assert(request.contract == "satp-contract");
  assert(request.signing_account == "bridge-user");
  assert(request.network.ledger_type == satp::model::LedgerType::kFabric);
  assert((request.params == std::vector<std::string>{"ExampleAsset", "User_A", "25", "s-1:lock"}));
  assert(request.idempotency_key == "s-1:lock");

  auto probe = AssetProtocol::OperationReceipt(Operation::kMint, Fabric(), Asset(satp::model::TokenType::kNonstandardFungible), "s-1");
  assert(probe.method == "GetOperationReceipt");
  assert(probe.params[1] == "s-1:mint");
  assert(AssetProtocol::BalanceOf(Fabric(), Asset(satp::model::TokenType::kNonstandardFungible), "User_A").method == "BalanceOf");
}

void TestEvmUsesWrapperContract() {
  auto request = AssetProtocol::Action(Operation::kBurn, Besu(), Asset(satp::model::TokenType::kErc20), "0xbridge", 7, "s-2");
  assert(request.method == "burn");
  assert(request.contract == "SATPWrapperContract");
  assert(request.signing_account == "0xbridge");
  assert(AssetProtocol::BalanceOf(Besu(), Asset(satp::model::TokenType::kErc20), "x").method == "balanceOf");
}

void TestNonFungibleQuantityIsOne() {
  for (auto type : {satp::model::TokenType::kErc721, satp::model::TokenType::kNonstandardNonfungible}) {
    assert(AssetProtocol::IsNonFungible(type));
    auto request = AssetProtocol::Action(Operation::kMint, Besu(), Asset(type), "User_B", 999, "s-3");
    assert(request.params[2] == "1");
  }
  assert(!AssetProtocol::IsNonFungible(satp::model::TokenType::kErc20));
}

void TestSimulatedFallsBackToAssetContract() {
  satp::model::NetworkOptions sim{"sim", std::chrono::milliseconds(1000), satp::model::SimulatedOptions{}};
  auto request = AssetProtocol::Action(Operation::kUnlock, sim, Asset(satp::model::TokenType::kErc20), "User_A", 1, "s-4");
  assert(request.contract == "asset-contract");
  assert(request.method == "unlock");
  assert(request.signing_account.empty());
}

void TestParseReceipt() {
  assert(!AssetProtocol::ParseReceipt("").has_value());
  assert(!AssetProtocol::ParseReceipt("null").has_value());
  assert(!AssetProtocol::ParseReceipt("none").has_value());
  assert(AssetProtocol::ParseReceipt("0xdeadbeef").value() == "0xdeadbeef");
}

} // namespace

int main() {
  TestFabricUsesChaincodeNames();
  TestEvmUsesWrapperContract();
  TestNonFungibleQuantityIsOne();
  TestSimulatedFallsBackToAssetContract();
  TestParseReceipt();

  std::cout << "asset_protocol_test: pass\n";
  return 0;
}
