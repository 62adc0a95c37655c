#include "internal/ledger/ledger_registry.hpp"

#include "internal/util/errors.hpp"

namespace satp::ledger {

void LedgerRegistry::Register(model::NetworkOptions options, std::shared_ptr<LedgerAdapter> adapter) {
  if (options.id.empty()) {
    throw util::InvalidArgument("network id must not be empty");
  }
  std::unique_lock lock(mutex_);
  auto             id = options.id;
  if (entries_.contains(id)) {
    throw util::AlreadyExists("network " + id + " registered twice");
  }
  entries_.emplace(std::move(id), Entry{std::move(options), std::move(adapter)});
}

const LedgerRegistry::Entry& LedgerRegistry::Get(const model::NetworkId& network) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(network.id);
  if (it == entries_.end()) {
    throw util::InvalidArgument("unknown network " + network.id);
  }
  if (network.ledger_type != model::LedgerType::kUnspecified && network.ledger_type != it->second.options.Type()) {
    throw util::InvalidArgument("network " + network.id + " is " + model::LedgerTypeName(it->second.options.Type()) + ", not " +
                                model::LedgerTypeName(network.ledger_type));
  }
  return it->second;
}

bool LedgerRegistry::Has(const std::string& network_id) const {
  std::shared_lock lock(mutex_);
  return entries_.contains(network_id);
}

std::vector<model::NetworkId> LedgerRegistry::Networks() const {
  std::shared_lock              lock(mutex_);
  std::vector<model::NetworkId> out;
  out.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) {
    out.push_back(entry.options.Id());
  }
  return out;
}

} // namespace satp::ledger
