#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/ledger/ledger_adapter.hpp"
#include "internal/model/ledger_options.hpp"

namespace satp::ledger {

/*
  Network id -> adapter and its connection options.

  Filled once at startup; lookups are concurrent.
*/
class LedgerRegistry {
 public:
  struct Entry {
    model::NetworkOptions          options;
    std::shared_ptr<LedgerAdapter> adapter;
  };

  void Register(model::NetworkOptions options, std::shared_ptr<LedgerAdapter> adapter);

  // util::InvalidArgument for an unknown network or mismatched ledger type
  const Entry& Get(const model::NetworkId& network) const;
  bool         Has(const std::string& network_id) const;

  std::vector<model::NetworkId> Networks() const;

 private:
  mutable std::shared_mutex    mutex_;
  std::map<std::string, Entry> entries_;
};

} // namespace satp::ledger
