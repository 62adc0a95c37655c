#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/session.hpp"

namespace satp::ledger {

struct InvokeRequest {
  model::NetworkId         network;
  std::string              contract;
  std::string              method;
  std::vector<std::string> params;
  std::string              signing_account;
  // stable per (session, operation); connectors may use it for dedup
  std::string idempotency_key;
};

struct QueryRequest {
  model::NetworkId         network;
  std::string              contract;
  std::string              method;
  std::vector<std::string> params;
};

// Returned only once the transaction is confirmed on-chain.
struct InvokeResult {
  std::string transaction_id;
  uint64_t    block_number = 0;
};

/*
  Capability for one ledger network.

  Invoke is at-least-once submitted, at-most-once confirmed: a thrown
  util::LedgerInvocationError does not prove the transaction did not land,
  callers probe with Query before resubmitting.
*/
class LedgerAdapter {
 public:
  virtual ~LedgerAdapter() = default;

  virtual InvokeResult Invoke(const InvokeRequest& request) = 0;
  virtual std::string  Query(const QueryRequest& request) = 0;
  virtual std::string  GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) = 0;
};

} // namespace satp::ledger
