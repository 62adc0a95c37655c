#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/session.hpp"

namespace satp::model {

/*
  Per-network connection options, one variant per ledger kind.
*/

struct FabricOptions {
  std::string connector_endpoint;
  std::string channel_name;
  std::string contract_name;
  std::string msp_id;
  // identity that holds escrowed assets; also the approve address
  std::string bridge_msp_id;
  std::string signing_identity;
};

struct BesuOptions {
  std::string connector_endpoint;
  std::string rpc_http_host;
  std::string rpc_ws_host;
  std::string wrapper_contract_name;
  std::string wrapper_contract_address;
  std::string eth_account;
  std::string secret;
  uint64_t    gas_limit = 0;
};

struct EthereumOptions {
  std::string connector_endpoint;
  std::string rpc_http_host;
  std::string wrapper_contract_name;
  std::string wrapper_contract_address;
  std::string eth_account;
  std::string secret;
  uint64_t    gas_limit       = 0;
  uint64_t    max_fee_per_gas = 0;
};

struct SimulatedOptions {
  std::string                     bridge_address;
  std::vector<TokenType>          supported_token_types;
  std::map<std::string, uint64_t> balances;
};

using LedgerOptions = std::variant<FabricOptions, BesuOptions, EthereumOptions, SimulatedOptions>;

struct NetworkOptions {
  std::string               id;
  std::chrono::milliseconds request_timeout{30000};
  LedgerOptions             ledger;

  LedgerType Type() const {
    if (std::holds_alternative<FabricOptions>(ledger)) return LedgerType::kFabric;
    if (std::holds_alternative<BesuOptions>(ledger)) return LedgerType::kBesu;
    if (std::holds_alternative<EthereumOptions>(ledger)) return LedgerType::kEthereum;
    return LedgerType::kSimulated;
  }

  NetworkId Id() const {
    return {id, Type()};
  }
};

} // namespace satp::model
