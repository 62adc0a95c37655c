#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/stage.hpp"

namespace satp::model {

enum class LedgerType : std::uint8_t {
  kUnspecified = 0,
  kFabric      = 1,
  kBesu        = 2,
  kEthereum    = 3,
  kSimulated   = 4,
};

enum class TokenType : std::uint8_t {
  kUnspecified            = 0,
  kNonstandardFungible    = 1,
  kNonstandardNonfungible = 2,
  kErc20                  = 3,
  kErc721                 = 4,
};

enum class SessionStatus : std::uint8_t {
  kUnspecified = 0,
  kInProgress  = 1,
  kSuccess     = 2,
  kFailed      = 3,
  kRolledBack  = 4,
};

// Proximate cause of an unrecoverable transfer failure.
enum class ErrorKind : std::uint8_t {
  kNone = 0,
  kLedgerInvocation,
  kInvalidState,
  kPersistence,
  kSessionBusy,
  kCancelled,
  kCompensationFailed,
  kInvalidRequest,
  kAborted,
};

struct NetworkId {
  std::string id;
  LedgerType  ledger_type = LedgerType::kUnspecified;

  bool operator==(const NetworkId&) const = default;
};

struct Asset {
  std::string id;
  std::string reference_id;
  std::string owner;
  std::string contract_name;
  std::string contract_address;
  std::string channel_name;
  std::string msp_id;
  NetworkId   network_id;
  TokenType   token_type = TokenType::kUnspecified;
  uint64_t    amount     = 0;
};

struct Receipt {
  Stage       stage = Stage::kUnspecified;
  std::string operation;
  NetworkId   network_id;
  std::string transaction_id;
  uint64_t    block_number    = 0;
  uint64_t    confirmed_at_ms = 0;
  // rebuilt from a probe after an ambiguous submission
  bool recovered = false;
};

struct SessionError {
  ErrorKind   kind = ErrorKind::kNone;
  std::string message;
};

/*
  One transfer attempt.

  Invariants:
  - session_id never changes once assigned.
  - stage only moves along CanTransition().
  - receipts only grow, and only with confirmed ledger results.
  - once status is terminal nothing else changes.
*/
struct SessionData {
  std::string        session_id;
  Stage              stage = Stage::kInitiated;
  std::vector<Stage> stage_history;

  NetworkId source_network;
  NetworkId destination_network;
  Asset     source_asset;
  Asset     destination_asset;
  uint64_t  amount = 0;

  // per-stage bounds
  uint32_t                  max_retries = 0;
  std::chrono::milliseconds max_timeout{0};
  uint32_t                  attempt_count = 0;

  SessionError         last_error;
  std::vector<Receipt> receipts;
  SessionStatus        status = SessionStatus::kInProgress;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t completed_at_ms = 0;

  // optimistic concurrency token, bumped by every store write
  uint64_t version = 0;

  std::string approve_address;
  bool        abort_requested = false;
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kSuccess || status == SessionStatus::kFailed || status == SessionStatus::kRolledBack;
}

const Receipt* FindReceipt(const SessionData& session, Stage stage);

const char* LedgerTypeName(LedgerType type);
const char* TokenTypeName(TokenType type);
const char* SessionStatusName(SessionStatus status);
const char* ErrorKindName(ErrorKind kind);
ErrorKind   ParseErrorKind(std::string_view name);

} // namespace satp::model
