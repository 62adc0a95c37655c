#include "internal/db/api/repository.hpp"

#include "internal/model/session.hpp"

namespace satp::db {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

bool IsTerminalStatus(uint32_t status) {
  return satp::model::IsTerminal(static_cast<satp::model::SessionStatus>(status));
}

} // namespace satp::db
