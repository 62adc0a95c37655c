#pragma once

#include <optional>
#include <string>

#include "internal/ledger/ledger_adapter.hpp"
#include "internal/model/ledger_options.hpp"

namespace satp::ledger {

enum class Operation {
  kLock,    // owner -> bridge escrow on the source
  kUnlock,  // bridge escrow -> owner on the source
  kMint,    // new units to the recipient on the destination
  kBurn,    // remove units held by an account
};

const char* OperationName(Operation op);

/*
  Maps protocol actions onto the contract calls of each ledger kind.

  Fabric chaincode exposes capitalized methods (Lock, Mint, ...); the EVM
  wrapper contracts on Besu and Ethereum use lower camel case. Every call
  carries "<session>:<operation>" so the operation can be probed later
  with GetOperationReceipt / getOperationReceipt, which answers with the
  transaction id or an empty string.

  Non-fungible assets always move quantity 1 of the asset id.
*/
class AssetProtocol {
 public:
  static InvokeRequest Action(Operation op, const model::NetworkOptions& network, const model::Asset& asset, const std::string& account,
                              uint64_t amount, const std::string& session_id);

  static QueryRequest BalanceOf(const model::NetworkOptions& network, const model::Asset& asset, const std::string& account);

  static QueryRequest OperationReceipt(Operation op, const model::NetworkOptions& network, const model::Asset& asset,
                                       const std::string& session_id);

  // Parses a probe answer: transaction id when the operation landed.
  static std::optional<std::string> ParseReceipt(const std::string& answer);

  static std::string OperationKey(Operation op, const std::string& session_id);

  static bool IsNonFungible(model::TokenType type);
};

} // namespace satp::ledger
