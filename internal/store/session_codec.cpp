#include "internal/store/session_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <limits>

#include "internal/util/errors.hpp"

namespace satp::store {

namespace pb = satp::gateway::v1;

namespace {

pb::Receipt ToProto(const model::Receipt& receipt) {
  pb::Receipt out;
  out.set_stage(static_cast<pb::Stage>(receipt.stage));
  out.set_operation(receipt.operation);
  *out.mutable_network_id() = store::ToProto(receipt.network_id);
  out.set_transaction_id(receipt.transaction_id);
  out.set_block_number(receipt.block_number);
  out.set_confirmed_at_ms(receipt.confirmed_at_ms);
  out.set_recovered(receipt.recovered);
  return out;
}

model::Receipt FromProto(const pb::Receipt& receipt) {
  model::Receipt out;
  out.stage           = static_cast<model::Stage>(receipt.stage());
  out.operation       = receipt.operation();
  out.network_id      = store::FromProto(receipt.network_id());
  out.transaction_id  = receipt.transaction_id();
  out.block_number    = receipt.block_number();
  out.confirmed_at_ms = receipt.confirmed_at_ms();
  out.recovered       = receipt.recovered();
  return out;
}

} // namespace

uint64_t ParseUnsigned(const std::string& field, const std::string& value) {
  if (value.empty() || value.size() > 19) {
    throw util::InvalidArgument(field + " must be a non-negative integer, got '" + value + "'");
  }
  uint64_t out = 0;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw util::InvalidArgument(field + " must be a non-negative integer, got '" + value + "'");
    }
    out = out * 10 + static_cast<uint64_t>(c - '0');
  }
  return out;
}

pb::NetworkId ToProto(const model::NetworkId& network) {
  pb::NetworkId out;
  out.set_id(network.id);
  out.set_ledger_type(static_cast<pb::LedgerType>(network.ledger_type));
  return out;
}

model::NetworkId FromProto(const pb::NetworkId& network) {
  return {network.id(), static_cast<model::LedgerType>(network.ledger_type())};
}

pb::Asset ToProto(const model::Asset& asset) {
  pb::Asset out;
  out.set_id(asset.id);
  out.set_reference_id(asset.reference_id);
  out.set_owner(asset.owner);
  out.set_contract_name(asset.contract_name);
  out.set_contract_address(asset.contract_address);
  out.set_channel_name(asset.channel_name);
  out.set_msp_id(asset.msp_id);
  *out.mutable_network_id() = ToProto(asset.network_id);
  out.set_token_type(static_cast<pb::TokenType>(asset.token_type));
  out.set_amount(asset.amount);
  return out;
}

model::Asset FromProto(const pb::Asset& asset) {
  model::Asset out;
  out.id               = asset.id();
  out.reference_id     = asset.reference_id();
  out.owner            = asset.owner();
  out.contract_name    = asset.contract_name();
  out.contract_address = asset.contract_address();
  out.channel_name     = asset.channel_name();
  out.msp_id           = asset.msp_id();
  out.network_id       = FromProto(asset.network_id());
  out.token_type       = static_cast<model::TokenType>(asset.token_type());
  out.amount           = asset.amount();
  return out;
}

pb::SessionData ToProto(const model::SessionData& session) {
  pb::SessionData out;
  out.set_session_id(session.session_id);
  out.set_stage(static_cast<pb::Stage>(session.stage));
  for (auto stage : session.stage_history) {
    out.add_stage_history(static_cast<pb::Stage>(stage));
  }
  *out.mutable_source_network()      = ToProto(session.source_network);
  *out.mutable_destination_network() = ToProto(session.destination_network);
  *out.mutable_source_asset()        = ToProto(session.source_asset);
  *out.mutable_destination_asset()   = ToProto(session.destination_asset);
  out.set_amount(session.amount);
  out.set_max_retries(std::to_string(session.max_retries));
  out.set_max_timeout_ms(std::to_string(session.max_timeout.count()));
  out.set_attempt_count(session.attempt_count);
  if (session.last_error.kind != model::ErrorKind::kNone || !session.last_error.message.empty()) {
    out.mutable_last_error()->set_kind(model::ErrorKindName(session.last_error.kind));
    out.mutable_last_error()->set_message(session.last_error.message);
  }
  for (const auto& receipt : session.receipts) {
    *out.add_receipts() = ToProto(receipt);
  }
  out.set_status(static_cast<pb::SessionStatus>(session.status));
  out.set_created_at_ms(session.created_at_ms);
  out.set_updated_at_ms(session.updated_at_ms);
  out.set_completed_at_ms(session.completed_at_ms);
  out.set_version(session.version);
  out.set_approve_address(session.approve_address);
  out.set_abort_requested(session.abort_requested);
  return out;
}

model::SessionData FromProto(const pb::SessionData& session) {
  model::SessionData out;
  out.session_id = session.session_id();
  out.stage      = static_cast<model::Stage>(session.stage());
  for (int stage : session.stage_history()) {
    out.stage_history.push_back(static_cast<model::Stage>(stage));
  }
  out.source_network      = FromProto(session.source_network());
  out.destination_network = FromProto(session.destination_network());
  out.source_asset        = FromProto(session.source_asset());
  out.destination_asset   = FromProto(session.destination_asset());
  out.amount              = session.amount();

  const auto max_retries = ParseUnsigned("max_retries", session.max_retries());
  if (max_retries > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidArgument("max_retries out of range: " + session.max_retries());
  }
  out.max_retries = static_cast<uint32_t>(max_retries);
  out.max_timeout = std::chrono::milliseconds(ParseUnsigned("max_timeout_ms", session.max_timeout_ms()));

  out.attempt_count      = session.attempt_count();
  out.last_error.kind    = model::ParseErrorKind(session.last_error().kind());
  out.last_error.message = session.last_error().message();
  for (const auto& receipt : session.receipts()) {
    out.receipts.push_back(FromProto(receipt));
  }
  out.status          = static_cast<model::SessionStatus>(session.status());
  out.created_at_ms   = session.created_at_ms();
  out.updated_at_ms   = session.updated_at_ms();
  out.completed_at_ms = session.completed_at_ms();
  out.version         = session.version();
  out.approve_address = session.approve_address();
  out.abort_requested = session.abort_requested();
  return out;
}

std::string ToJson(const model::SessionData& session) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(session), &json, options);
  if (!status.ok()) {
    throw util::PersistenceError("encode session " + session.session_id + ": " + std::string(status.message()));
  }
  return json;
}

model::SessionData FromJson(const std::string& json) {
  pb::SessionData                          message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::PersistenceError("decode session: " + std::string(status.message()));
  }
  try {
    return FromProto(message);
  } catch (const util::InvalidArgument& e) {
    throw util::PersistenceError("decode session " + message.session_id() + ": " + e.what());
  }
}

} // namespace satp::store
