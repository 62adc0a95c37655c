#include "internal/ledger/simulated_ledger.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace satp::ledger {

namespace {

// Fabric and EVM spellings of the same method share one entry.
std::string Normalize(std::string method) {
  if (!method.empty()) {
    method[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(method[0])));
  }
  return method;
}

uint64_t ParseAmount(const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw util::LedgerInvocationError("malformed amount '" + value + "'", false);
  }
  return std::stoull(value);
}

} // namespace

SimulatedLedger::SimulatedLedger(model::NetworkId network, model::SimulatedOptions options)
    : network_(std::move(network)), options_(std::move(options)), balances_(options_.balances.begin(), options_.balances.end()) {
  if (options_.bridge_address.empty()) {
    options_.bridge_address = "bridge@" + network_.id;
  }
}

InvokeResult SimulatedLedger::Invoke(const InvokeRequest& request) {
  const auto method = Normalize(request.method);

  std::lock_guard lock(mutex_);
  ++invoke_counts_[method];

  if (auto it = permanent_faults_.find(method); it != permanent_faults_.end()) {
    throw util::LedgerInvocationError(network_.id + ": " + method + " rejected", it->second.retryable);
  }

  if (auto it = pending_faults_.find(method); it != pending_faults_.end() && !it->second.empty()) {
    const auto fault = it->second.front();
    it->second.pop_front();
    if (fault.landed) {
      Apply(method, request);
      throw util::LedgerInvocationError(network_.id + ": " + method + " timed out waiting for confirmation", fault.retryable);
    }
    throw util::LedgerInvocationError(network_.id + ": " + method + " submission failed", fault.retryable);
  }

  return Apply(method, request);
}

InvokeResult SimulatedLedger::Apply(const std::string& method, const InvokeRequest& request) {
  if (request.params.size() < 4) {
    throw util::LedgerInvocationError(method + ": expected (asset, account, amount, key)", false);
  }
  const auto& account = request.params[1];
  const auto  amount  = ParseAmount(request.params[2]);
  const auto& key     = request.params[3];

  if (auto it = applied_.find(key); it != applied_.end()) {
    return it->second;
  }

  if (method == "lock") {
    Debit(account, amount);
    balances_[options_.bridge_address] += amount;
  } else if (method == "unlock") {
    Debit(options_.bridge_address, amount);
    balances_[account] += amount;
  } else if (method == "mint") {
    balances_[account] += amount;
  } else if (method == "burn") {
    Debit(account, amount);
  } else {
    throw util::LedgerInvocationError("unsupported method " + request.method, false);
  }

  InvokeResult result;
  result.block_number   = ++block_number_;
  result.transaction_id = network_.id + "-tx-" + std::to_string(result.block_number);
  applied_.emplace(key, result);
  return result;
}

void SimulatedLedger::Debit(const std::string& account, uint64_t amount) {
  auto& balance = balances_[account];
  if (balance < amount) {
    throw util::LedgerInvocationError("insufficient balance for " + account + ": has " + std::to_string(balance) + ", needs " + std::to_string(amount),
                                      false);
  }
  balance -= amount;
}

std::string SimulatedLedger::Query(const QueryRequest& request) {
  const auto method = Normalize(request.method);

  std::lock_guard lock(mutex_);
  ++query_counts_[method];
  if (failing_queries_ > 0) {
    --failing_queries_;
    throw util::LedgerInvocationError(network_.id + ": query " + method + " unavailable");
  }

  if (request.params.size() < 2) {
    throw util::LedgerInvocationError(method + ": expected (asset, argument)", false);
  }

  if (method == "balanceOf") {
    auto it = balances_.find(request.params[1]);
    return std::to_string(it == balances_.end() ? 0 : it->second);
  }
  if (method == "getOperationReceipt") {
    auto it = applied_.find(request.params[1]);
    return it == applied_.end() ? std::string() : it->second.transaction_id;
  }
  throw util::LedgerInvocationError("unsupported query " + request.method, false);
}

std::string SimulatedLedger::GetApproveAddress(const model::NetworkId& network, model::TokenType token_type) {
  if (network.id != network_.id) {
    throw util::InvalidArgument("simulated ledger " + network_.id + " cannot serve network " + network.id);
  }
  const auto& supported = options_.supported_token_types;
  if (!supported.empty() && std::find(supported.begin(), supported.end(), token_type) == supported.end()) {
    throw util::InvalidArgument(std::string("token type ") + model::TokenTypeName(token_type) + " not supported on " + network_.id);
  }
  return options_.bridge_address;
}

uint64_t SimulatedLedger::BalanceOf(const std::string& account) const {
  std::lock_guard lock(mutex_);
  auto            it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

void SimulatedLedger::SetBalance(const std::string& account, uint64_t amount) {
  std::lock_guard lock(mutex_);
  balances_[account] = amount;
}

std::string SimulatedLedger::BridgeAddress() const {
  return options_.bridge_address;
}

void SimulatedLedger::FailNext(const std::string& method, uint32_t count, bool landed, bool retryable) {
  std::lock_guard lock(mutex_);
  auto&           queue = pending_faults_[Normalize(method)];
  for (uint32_t i = 0; i < count; ++i) {
    queue.push_back(Fault{landed, retryable});
  }
}

void SimulatedLedger::FailAlways(const std::string& method, bool retryable) {
  std::lock_guard lock(mutex_);
  permanent_faults_[Normalize(method)] = Fault{false, retryable};
}

void SimulatedLedger::FailQueries(uint32_t count) {
  std::lock_guard lock(mutex_);
  failing_queries_ = count;
}

void SimulatedLedger::ClearFaults() {
  std::lock_guard lock(mutex_);
  pending_faults_.clear();
  permanent_faults_.clear();
  failing_queries_ = 0;
}

uint32_t SimulatedLedger::InvokeCount(const std::string& method) const {
  std::lock_guard lock(mutex_);
  auto            it = invoke_counts_.find(Normalize(method));
  return it == invoke_counts_.end() ? 0 : it->second;
}

uint32_t SimulatedLedger::QueryCount(const std::string& method) const {
  std::lock_guard lock(mutex_);
  auto            it = query_counts_.find(Normalize(method));
  return it == query_counts_.end() ? 0 : it->second;
}

} // namespace satp::ledger
