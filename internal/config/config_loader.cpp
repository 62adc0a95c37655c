#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace satp::config {

using satp::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultServerPort        = 3010;
constexpr uint32_t kDefaultClientPort        = 3011;
constexpr uint32_t kDefaultMaxRetries        = 5;
constexpr uint64_t kDefaultMaxTimeoutMs      = 60000;
constexpr uint64_t kDefaultInitialBackoffMs  = 200;
constexpr uint64_t kDefaultMaxBackoffMs      = 5000;
constexpr uint32_t kDefaultWorkerThreads     = 4;
constexpr uint32_t kDefaultRequestTimeoutMs  = 30000;
constexpr const char* kDefaultProtocolVersion = "v02";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* gateway = config.mutable_gateway();
  if (gateway->name().empty()) gateway->set_name("satp-gateway");
  if (gateway->id().empty()) gateway->set_id(gateway->name());
  if (gateway->gateway_server_port() == 0) gateway->set_gateway_server_port(kDefaultServerPort);
  if (gateway->gateway_client_port() == 0) gateway->set_gateway_client_port(kDefaultClientPort);
  if (gateway->version_size() == 0) {
    auto* version = gateway->add_version();
    version->set_core(kDefaultProtocolVersion);
    version->set_architecture(kDefaultProtocolVersion);
    version->set_crash(kDefaultProtocolVersion);
  }

  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:" + std::to_string(gateway->gateway_server_port()));
  }

  if (config.database().backend_case() == satp::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    config.mutable_database()->mutable_sqlite()->set_path("satp-gateway.db");
  }
  if (config.database().has_postgres() && config.database().postgres().max_connections() == 0) {
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
  }

  auto* retry = config.mutable_retry();
  if (retry->max_retries() == 0) retry->set_max_retries(kDefaultMaxRetries);
  if (retry->max_timeout_ms() == 0) retry->set_max_timeout_ms(kDefaultMaxTimeoutMs);
  if (retry->initial_backoff_ms() == 0) retry->set_initial_backoff_ms(kDefaultInitialBackoffMs);
  if (retry->max_backoff_ms() == 0) retry->set_max_backoff_ms(kDefaultMaxBackoffMs);

  if (config.workers().threads() == 0) config.mutable_workers()->set_threads(kDefaultWorkerThreads);

  for (auto& network : *config.mutable_networks()) {
    if (network.request_timeout_ms() == 0) network.set_request_timeout_ms(kDefaultRequestTimeoutMs);
  }

  if (config.logging().level().empty()) config.mutable_logging()->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.retry().max_backoff_ms() < config.retry().initial_backoff_ms()) {
    throw std::runtime_error("Invalid configuration: retry.max_backoff_ms must be >= retry.initial_backoff_ms");
  }

  std::set<std::string> seen;
  for (const auto& network : config.networks()) {
    if (network.id().empty()) {
      throw std::runtime_error("Invalid configuration: every network needs an id");
    }
    if (!seen.insert(network.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate network id " + network.id());
    }
    if (network.ledger_case() == satp::runtime::config::NetworkConfig::LEDGER_NOT_SET) {
      throw std::runtime_error("Invalid configuration: network " + network.id() + " has no ledger options");
    }
    if (network.has_fabric() && network.fabric().connector_endpoint().empty()) {
      throw std::runtime_error("Invalid configuration: network " + network.id() + " needs fabric.connector_endpoint");
    }
    if (network.has_besu() && network.besu().connector_endpoint().empty()) {
      throw std::runtime_error("Invalid configuration: network " + network.id() + " needs besu.connector_endpoint");
    }
    if (network.has_ethereum() && network.ethereum().connector_endpoint().empty()) {
      throw std::runtime_error("Invalid configuration: network " + network.id() + " needs ethereum.connector_endpoint");
    }
  }
}

} // namespace satp::config
