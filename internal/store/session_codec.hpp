#pragma once

#include <string>

#include "internal/model/session.hpp"
#include "satp/gateway/v1/session.pb.h"

namespace satp::store {

/*
  Conversion between the in-memory session and its wire/persisted form.

  max_retries and max_timeout are integers in memory and decimal strings
  on the wire. Parsing rejects anything that is not a plain unsigned
  decimal with util::InvalidArgument.
*/

satp::gateway::v1::NetworkId ToProto(const model::NetworkId& network);
model::NetworkId             FromProto(const satp::gateway::v1::NetworkId& network);

satp::gateway::v1::Asset ToProto(const model::Asset& asset);
model::Asset             FromProto(const satp::gateway::v1::Asset& asset);

satp::gateway::v1::SessionData ToProto(const model::SessionData& session);
model::SessionData             FromProto(const satp::gateway::v1::SessionData& session);

std::string        ToJson(const model::SessionData& session);
model::SessionData FromJson(const std::string& json);

uint64_t ParseUnsigned(const std::string& field, const std::string& value);

} // namespace satp::store
