#pragma once

#include "satp/gateway/v1/types.pb.h"
#include "satp/gateway/v1/session.pb.h"
#include "satp/gateway/v1/gateway_service.pb.h"
#include "satp/gateway/v1/connector_service.pb.h"

#include "satp/gateway/v1/gateway_service.grpc.pb.h"
#include "satp/gateway/v1/connector_service.grpc.pb.h"

namespace satp::gateway::v1 {

// Aggregate include for the public gateway API.

} // namespace satp::gateway::v1
