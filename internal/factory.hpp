#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/dispatcher.hpp"
#include "internal/core/satp_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/ledger_registry.hpp"
#include "internal/model/gateway_identity.hpp"
#include "internal/model/ledger_options.hpp"
#include "internal/store/session_store.hpp"

namespace satp::factory {

/*
  Application

  Owns every long-lived component of the gateway. Destroying it stops the
  worker pool; sessions still executing stay persisted for the next start.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<store::SessionStore>     store;
  std::shared_ptr<ledger::LedgerRegistry>  ledgers;
  std::shared_ptr<core::SatpManager>       manager;
  std::shared_ptr<core::Dispatcher>        dispatcher;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root: the only place that knows concrete database and
  ledger types.
*/
Application Build(const satp::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository>         BuildRepository(const satp::runtime::config::RuntimeConfig& config);
std::shared_ptr<ledger::LedgerRegistry> BuildLedgerRegistry(const satp::runtime::config::RuntimeConfig& config);

model::NetworkOptions  ToNetworkOptions(const satp::runtime::config::NetworkConfig& network);
model::GatewayIdentity ToGatewayIdentity(const satp::runtime::config::GatewayIdentityConfig& gateway);

} // namespace satp::factory
