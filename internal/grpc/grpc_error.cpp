#include "internal/grpc/grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace satp::grpc {

namespace {

::grpc::StatusCode TransactCode(const satp::util::TransactError& e) {
  using satp::model::ErrorKind;

  switch (e.Kind()) {
    case ErrorKind::kInvalidRequest:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorKind::kSessionBusy:
      return ::grpc::StatusCode::ABORTED;
    case ErrorKind::kCancelled:
      return ::grpc::StatusCode::UNAVAILABLE;
    case ErrorKind::kInvalidState:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorKind::kPersistence:
    case ErrorKind::kCompensationFailed:
      return ::grpc::StatusCode::INTERNAL;
    default:
      break;
  }
  // rolled back after a ledger failure or an abort
  return e.Status() == satp::model::SessionStatus::kRolledBack ? ::grpc::StatusCode::ABORTED : ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace satp::util;

  if (const auto* transact = dynamic_cast<const TransactError*>(&e)) {
    return {TransactCode(*transact), e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidStateError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const SessionBusyError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const LedgerInvocationError*>(&e) || dynamic_cast<const CancelledError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace satp::grpc
