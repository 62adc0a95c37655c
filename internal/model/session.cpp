#include "internal/model/session.hpp"

namespace satp::model {

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::kInitiated:
      return "INITIATED";
    case Stage::kSourceLockPending:
      return "SOURCE_LOCK_PENDING";
    case Stage::kSourceLockConfirmed:
      return "SOURCE_LOCK_CONFIRMED";
    case Stage::kDestinationMintPending:
      return "DESTINATION_MINT_PENDING";
    case Stage::kDestinationMintConfirmed:
      return "DESTINATION_MINT_CONFIRMED";
    case Stage::kCompleted:
      return "COMPLETED";
    case Stage::kRollbackPending:
      return "ROLLBACK_PENDING";
    case Stage::kRolledBack:
      return "ROLLED_BACK";
    case Stage::kUnspecified:
      break;
  }
  return "UNSPECIFIED";
}

const Receipt* FindReceipt(const SessionData& session, Stage stage) {
  for (auto it = session.receipts.rbegin(); it != session.receipts.rend(); ++it) {
    if (it->stage == stage) {
      return &*it;
    }
  }
  return nullptr;
}

const char* LedgerTypeName(LedgerType type) {
  switch (type) {
    case LedgerType::kFabric:
      return "FABRIC_2";
    case LedgerType::kBesu:
      return "BESU_2X";
    case LedgerType::kEthereum:
      return "ETHEREUM";
    case LedgerType::kSimulated:
      return "SIMULATED";
    case LedgerType::kUnspecified:
      break;
  }
  return "UNSPECIFIED";
}

const char* TokenTypeName(TokenType type) {
  switch (type) {
    case TokenType::kNonstandardFungible:
      return "NONSTANDARD_FUNGIBLE";
    case TokenType::kNonstandardNonfungible:
      return "NONSTANDARD_NONFUNGIBLE";
    case TokenType::kErc20:
      return "ERC20";
    case TokenType::kErc721:
      return "ERC721";
    case TokenType::kUnspecified:
      break;
  }
  return "UNSPECIFIED";
}

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kInProgress:
      return "IN_PROGRESS";
    case SessionStatus::kSuccess:
      return "SUCCESS";
    case SessionStatus::kFailed:
      return "FAILED";
    case SessionStatus::kRolledBack:
      return "ROLLED_BACK";
    case SessionStatus::kUnspecified:
      break;
  }
  return "UNSPECIFIED";
}

namespace {

constexpr struct {
  ErrorKind   kind;
  const char* name;
} kErrorKindNames[] = {
    {ErrorKind::kNone, "none"},
    {ErrorKind::kLedgerInvocation, "ledger_invocation"},
    {ErrorKind::kInvalidState, "invalid_state"},
    {ErrorKind::kPersistence, "persistence"},
    {ErrorKind::kSessionBusy, "session_busy"},
    {ErrorKind::kCancelled, "cancelled"},
    {ErrorKind::kCompensationFailed, "compensation_failed"},
    {ErrorKind::kInvalidRequest, "invalid_request"},
    {ErrorKind::kAborted, "aborted"},
};

} // namespace

const char* ErrorKindName(ErrorKind kind) {
  for (const auto& entry : kErrorKindNames) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "none";
}

ErrorKind ParseErrorKind(std::string_view name) {
  for (const auto& entry : kErrorKindNames) {
    if (name == entry.name) {
      return entry.kind;
    }
  }
  return ErrorKind::kNone;
}

} // namespace satp::model
