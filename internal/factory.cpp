#include "internal/factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/gateway_server.hpp"
#include "internal/ledger/connector_ledger_adapter.hpp"
#include "internal/ledger/simulated_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/clock.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/service/gateway_service.hpp"
#include "internal/service/service_context.hpp"
#if SATP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SATP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace satp::factory {

using satp::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SATP_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SATP_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

model::NetworkOptions ToNetworkOptions(const satp::runtime::config::NetworkConfig& network) {
  model::NetworkOptions options;
  options.id              = network.id();
  options.request_timeout = std::chrono::milliseconds(network.request_timeout_ms());

  if (network.has_fabric()) {
    const auto&          in = network.fabric();
    model::FabricOptions fabric;
    fabric.connector_endpoint = in.connector_endpoint();
    fabric.channel_name       = in.channel_name();
    fabric.contract_name      = in.contract_name();
    fabric.msp_id             = in.msp_id();
    fabric.bridge_msp_id      = in.bridge_msp_id();
    fabric.signing_identity   = in.signing_identity();
    options.ledger            = std::move(fabric);
  } else if (network.has_besu()) {
    const auto&        in = network.besu();
    model::BesuOptions besu;
    besu.connector_endpoint       = in.connector_endpoint();
    besu.rpc_http_host            = in.rpc_http_host();
    besu.rpc_ws_host              = in.rpc_ws_host();
    besu.wrapper_contract_name    = in.wrapper_contract_name();
    besu.wrapper_contract_address = in.wrapper_contract_address();
    besu.eth_account              = in.eth_account();
    besu.secret                   = in.secret();
    besu.gas_limit                = in.gas_limit();
    options.ledger                = std::move(besu);
  } else if (network.has_ethereum()) {
    const auto&            in = network.ethereum();
    model::EthereumOptions eth;
    eth.connector_endpoint       = in.connector_endpoint();
    eth.rpc_http_host            = in.rpc_http_host();
    eth.wrapper_contract_name    = in.wrapper_contract_name();
    eth.wrapper_contract_address = in.wrapper_contract_address();
    eth.eth_account              = in.eth_account();
    eth.secret                   = in.secret();
    eth.gas_limit                = in.gas_limit();
    eth.max_fee_per_gas          = in.max_fee_per_gas();
    options.ledger               = std::move(eth);
  } else if (network.has_simulated()) {
    const auto&             in = network.simulated();
    model::SimulatedOptions simulated;
    simulated.bridge_address = in.bridge_address();
    for (const auto token_type : in.supported_token_types()) {
      simulated.supported_token_types.push_back(static_cast<model::TokenType>(token_type));
    }
    for (const auto& [account, balance] : in.balances()) {
      simulated.balances.emplace(account, balance);
    }
    options.ledger = std::move(simulated);
  } else {
    throw std::runtime_error("network " + network.id() + " has no ledger options");
  }
  return options;
}

model::GatewayIdentity ToGatewayIdentity(const satp::runtime::config::GatewayIdentityConfig& gateway) {
  model::GatewayIdentity identity;
  identity.id       = gateway.id();
  identity.name     = gateway.name();
  identity.proof_id = gateway.proof_id();
  identity.address  = gateway.address();
  for (const auto& version : gateway.version()) {
    identity.version.push_back({version.core(), version.architecture(), version.crash()});
  }
  if (gateway.gateway_server_port() != 0) identity.gateway_server_port = gateway.gateway_server_port();
  if (gateway.gateway_client_port() != 0) identity.gateway_client_port = gateway.gateway_client_port();
  return identity;
}

std::shared_ptr<ledger::LedgerRegistry> BuildLedgerRegistry(const RuntimeConfig& config) {
  auto registry = std::make_shared<ledger::LedgerRegistry>();
  for (const auto& network : config.networks()) {
    auto options = ToNetworkOptions(network);

    std::shared_ptr<ledger::LedgerAdapter> adapter;
    if (const auto* simulated = std::get_if<model::SimulatedOptions>(&options.ledger)) {
      adapter = std::make_shared<ledger::SimulatedLedger>(options.Id(), *simulated);
    } else {
      adapter = std::make_shared<ledger::ConnectorLedgerAdapter>(options);
    }

    SATP_LOG_INFO("ledger network registered", {observability::StringField("network", options.id),
                                                observability::StringField("ledger", model::LedgerTypeName(options.Type()))});
    registry->Register(std::move(options), std::move(adapter));
  }
  return registry;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<store::SessionStore>(app.repository);

  // ------------------------------------------------------------------
  // Ledgers and transfer execution
  // ------------------------------------------------------------------
  app.ledgers = BuildLedgerRegistry(config);

  const auto& retry   = config.retry();
  auto        policy  = std::make_shared<retry::ExponentialBackoffPolicy>(std::chrono::milliseconds(retry.initial_backoff_ms()),
                                                                          std::chrono::milliseconds(retry.max_backoff_ms()));
  auto        clock   = std::make_shared<retry::SteadyClock>();
  auto        sleeper = std::make_shared<retry::InterruptibleSleeper>();
  auto        machine = std::make_shared<core::TransferStateMachine>(app.store, app.ledgers, policy, clock, sleeper);

  core::SatpManager::Options manager_options;
  manager_options.worker_threads = config.workers().threads();
  app.manager                    = std::make_shared<core::SatpManager>(app.store, machine, sleeper, manager_options);

  core::Dispatcher::Defaults defaults;
  defaults.max_retries = retry.max_retries();
  defaults.max_timeout = std::chrono::milliseconds(retry.max_timeout_ms());
  app.dispatcher       = std::make_shared<core::Dispatcher>(app.manager, app.store, app.ledgers, ToGatewayIdentity(config.gateway()), defaults);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.dispatcher = app.dispatcher;

  auto gateway_service = std::make_shared<service::GatewayService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::GatewayServer>(gateway_service));

  if (config.workers().recover_on_start()) {
    app.dispatcher->RecoverPendingSessions();
  }
  return app;
}

} // namespace satp::factory
