#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace satp::model {

struct GatewayVersion {
  std::string core;
  std::string architecture;
  std::string crash;
};

struct GatewayIdentity {
  std::string                 id;
  std::string                 name;
  std::vector<GatewayVersion> version;
  std::string                 proof_id;
  std::string                 address;
  uint32_t                    gateway_server_port = 3010;
  uint32_t                    gateway_client_port = 3011;
};

} // namespace satp::model
