#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "internal/ledger/ledger_adapter.hpp"
#include "internal/model/ledger_options.hpp"

namespace satp::ledger {

/*
  In-process token ledger for one network.

  Holds account balances, an escrow account (the bridge address) and the
  receipt of every operation key it has applied. Re-submitting an applied
  key is a no-op that returns the original receipt.

  Fault injection:
    FailNext(method, n, landed)  next n invokes of method fail; when landed
                                 is true the effect is applied first, which
                                 models a timeout after submission
    FailAlways(method)           every invoke of method fails, nothing lands
    FailQueries(n)               next n queries fail
*/
class SimulatedLedger final : public LedgerAdapter {
 public:
  SimulatedLedger(model::NetworkId network, model::SimulatedOptions options);

  InvokeResult Invoke(const InvokeRequest& request) override;
  std::string  Query(const QueryRequest& request) override;
  std::string  GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) override;

  uint64_t    BalanceOf(const std::string& account) const;
  void        SetBalance(const std::string& account, uint64_t amount);
  std::string BridgeAddress() const;

  void FailNext(const std::string& method, uint32_t count, bool landed = false, bool retryable = true);
  void FailAlways(const std::string& method, bool retryable = true);
  void FailQueries(uint32_t count);
  void ClearFaults();

  uint32_t InvokeCount(const std::string& method) const;
  uint32_t QueryCount(const std::string& method) const;

 private:
  struct Fault {
    bool landed    = false;
    bool retryable = true;
  };

  InvokeResult Apply(const std::string& method, const InvokeRequest& request);
  void         Debit(const std::string& account, uint64_t amount);

  model::NetworkId        network_;
  model::SimulatedOptions options_;

  mutable std::mutex                        mutex_;
  std::map<std::string, uint64_t>           balances_;
  std::map<std::string, InvokeResult>       applied_;
  std::map<std::string, std::deque<Fault>>  pending_faults_;
  std::map<std::string, Fault>              permanent_faults_;
  uint32_t                                  failing_queries_ = 0;
  std::map<std::string, uint32_t>           invoke_counts_;
  std::map<std::string, uint32_t>           query_counts_;
  uint64_t                                  block_number_ = 0;
};

} // namespace satp::ledger
