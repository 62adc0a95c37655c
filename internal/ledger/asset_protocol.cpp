#include "internal/ledger/asset_protocol.hpp"

#include <cctype>

namespace satp::ledger {

namespace {

bool UsesChaincodeNaming(const model::NetworkOptions& network) {
  return std::holds_alternative<model::FabricOptions>(network.ledger);
}

std::string MethodName(const model::NetworkOptions& network, std::string evm_name) {
  if (UsesChaincodeNaming(network) && !evm_name.empty()) {
    evm_name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(evm_name[0])));
  }
  return evm_name;
}

std::string ContractOf(const model::NetworkOptions& network, const model::Asset& asset) {
  if (const auto* fabric = std::get_if<model::FabricOptions>(&network.ledger)) {
    return fabric->contract_name.empty() ? asset.contract_name : fabric->contract_name;
  }
  if (const auto* besu = std::get_if<model::BesuOptions>(&network.ledger)) {
    return besu->wrapper_contract_name.empty() ? asset.contract_name : besu->wrapper_contract_name;
  }
  if (const auto* eth = std::get_if<model::EthereumOptions>(&network.ledger)) {
    return eth->wrapper_contract_name.empty() ? asset.contract_name : eth->wrapper_contract_name;
  }
  return asset.contract_name;
}

std::string SigningAccount(const model::NetworkOptions& network) {
  if (const auto* fabric = std::get_if<model::FabricOptions>(&network.ledger)) return fabric->signing_identity;
  if (const auto* besu = std::get_if<model::BesuOptions>(&network.ledger)) return besu->eth_account;
  if (const auto* eth = std::get_if<model::EthereumOptions>(&network.ledger)) return eth->eth_account;
  return {};
}

} // namespace

const char* OperationName(Operation op) {
  switch (op) {
    case Operation::kLock:
      return "lock";
    case Operation::kUnlock:
      return "unlock";
    case Operation::kMint:
      return "mint";
    case Operation::kBurn:
      return "burn";
  }
  return "unknown";
}

bool AssetProtocol::IsNonFungible(model::TokenType type) {
  return type == model::TokenType::kNonstandardNonfungible || type == model::TokenType::kErc721;
}

std::string AssetProtocol::OperationKey(Operation op, const std::string& session_id) {
  return session_id + ":" + OperationName(op);
}

InvokeRequest AssetProtocol::Action(Operation op, const model::NetworkOptions& network, const model::Asset& asset, const std::string& account,
                                    uint64_t amount, const std::string& session_id) {
  InvokeRequest request;
  request.network         = network.Id();
  request.contract        = ContractOf(network, asset);
  request.method          = MethodName(network, OperationName(op));
  request.signing_account = SigningAccount(network);
  request.idempotency_key = OperationKey(op, session_id);

  const auto quantity = IsNonFungible(asset.token_type) ? uint64_t{1} : amount;
  request.params      = {asset.id, account, std::to_string(quantity), request.idempotency_key};
  return request;
}

QueryRequest AssetProtocol::BalanceOf(const model::NetworkOptions& network, const model::Asset& asset, const std::string& account) {
  QueryRequest request;
  request.network  = network.Id();
  request.contract = ContractOf(network, asset);
  request.method   = MethodName(network, "balanceOf");
  request.params   = {asset.id, account};
  return request;
}

QueryRequest AssetProtocol::OperationReceipt(Operation op, const model::NetworkOptions& network, const model::Asset& asset,
                                             const std::string& session_id) {
  QueryRequest request;
  request.network  = network.Id();
  request.contract = ContractOf(network, asset);
  request.method   = MethodName(network, "getOperationReceipt");
  request.params   = {asset.id, OperationKey(op, session_id)};
  return request;
}

std::optional<std::string> AssetProtocol::ParseReceipt(const std::string& answer) {
  if (answer.empty() || answer == "null" || answer == "none") {
    return std::nullopt;
  }
  return answer;
}

} // namespace satp::ledger
