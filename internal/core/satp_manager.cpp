#include "internal/core/satp_manager.hpp"

#include <exception>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace satp::core {

using observability::StringField;

namespace {

std::future<model::SessionData> Rejected(const std::string& session_id, model::ErrorKind kind, model::SessionStatus status,
                                         const std::string& cause) {
  std::promise<model::SessionData> promise;
  promise.set_exception(std::make_exception_ptr(util::TransactError(session_id, kind, status, cause)));
  return promise.get_future();
}

// Outcome of a session that already reached a terminal status.
std::future<model::SessionData> Recorded(const model::SessionData& session) {
  if (session.status == model::SessionStatus::kSuccess) {
    std::promise<model::SessionData> promise;
    promise.set_value(session);
    return promise.get_future();
  }
  const auto kind = session.status == model::SessionStatus::kFailed ? model::ErrorKind::kCompensationFailed : session.last_error.kind;
  return Rejected(session.session_id, kind, session.status, session.last_error.message);
}

} // namespace

SatpManager::SatpManager(std::shared_ptr<store::SessionStore> store, std::shared_ptr<TransferStateMachine> machine,
                         std::shared_ptr<retry::Sleeper> sleeper, Options options)
    : store_(std::move(store)),
      machine_(std::move(machine)),
      sleeper_(std::move(sleeper)),
      queue_(std::make_shared<TransferQueue>()),
      workers_(std::make_unique<TransferWorkerPool>(queue_, options.worker_threads)) {
  workers_->Start();
}

SatpManager::~SatpManager() {
  Shutdown();
}

std::future<model::SessionData> SatpManager::Transfer(model::SessionData session) {
  if (session.session_id.empty()) {
    throw util::InvalidArgument("session_id is required");
  }

  auto guard = registry_.TryAcquire(session.session_id);

  try {
    if (auto stored = store_->Find(session.session_id)) {
      registry_.Record(*stored);
      if (model::IsTerminal(stored->status)) {
        SATP_LOG_DEBUG("session already terminal", {StringField("session_id", stored->session_id),
                                                    StringField("status", model::SessionStatusName(stored->status))});
        return Recorded(*stored);
      }
      return Schedule(std::move(guard), std::move(*stored));
    }

    session.stage         = model::Stage::kInitiated;
    session.stage_history = {model::Stage::kInitiated};
    session.status        = model::SessionStatus::kInProgress;
    session.attempt_count = 0;
    session.last_error    = {};
    session.receipts.clear();
    session.version         = 0;
    session.abort_requested = false;
    session                 = store_->Put(session);
  } catch (const util::PersistenceError& e) {
    return Rejected(session.session_id, model::ErrorKind::kPersistence, model::SessionStatus::kInProgress, e.what());
  } catch (const util::InvalidStateError& e) {
    return Rejected(session.session_id, model::ErrorKind::kInvalidState, model::SessionStatus::kInProgress, e.what());
  }

  registry_.Record(session);
  SATP_LOG_INFO("transfer accepted", {StringField("session_id", session.session_id), StringField("source", session.source_network.id),
                                      StringField("destination", session.destination_network.id)});
  return Schedule(std::move(guard), std::move(session));
}

std::future<model::SessionData> SatpManager::Resume(const std::string& session_id) {
  auto guard  = registry_.TryAcquire(session_id);
  auto stored = store_->Get(session_id);
  registry_.Record(stored);
  if (model::IsTerminal(stored.status)) {
    return Recorded(stored);
  }
  return Schedule(std::move(guard), std::move(stored));
}

std::future<model::SessionData> SatpManager::Schedule(SessionRegistry::Guard guard, model::SessionData session) {
  auto promise = std::make_shared<std::promise<model::SessionData>>();
  auto future  = promise->get_future();
  auto held    = std::make_shared<SessionRegistry::Guard>(std::move(guard));

  const auto session_id = session.session_id;

  TransferTask task;
  task.session_id = session_id;
  task.run        = [this, held, promise, session_id]() mutable {
    observability::Metrics::Instance().SetActiveSessions(++active_);

    std::exception_ptr                failure;
    std::optional<model::SessionData> done;
    try {
      auto guard_ref = held;
      done           = machine_->Run(session_id, [guard_ref]() { return guard_ref->AbortRequested(); });
      registry_.Record(*done);
    } catch (const util::TransactError&) {
      failure = std::current_exception();
      try {
        if (auto stored = store_->Find(session_id)) registry_.Record(*stored);
      } catch (const std::exception& e) {
        SATP_LOG_WARN("could not refresh registry entry", {StringField("session_id", session_id), StringField("error", e.what())});
      }
    } catch (const std::exception& e) {
      failure = std::make_exception_ptr(
          util::TransactError(session_id, model::ErrorKind::kInvalidState, model::SessionStatus::kInProgress, e.what()));
    }

    observability::Metrics::Instance().SetActiveSessions(--active_);

    // the session is free again before the caller sees the outcome
    held.reset();
    if (failure) {
      promise->set_exception(failure);
    } else {
      promise->set_value(std::move(*done));
    }
  };

  if (!queue_->Enqueue(std::move(task))) {
    promise->set_exception(std::make_exception_ptr(
        util::TransactError(session_id, model::ErrorKind::kCancelled, model::SessionStatus::kInProgress, "gateway is shutting down")));
  }
  return future;
}

std::size_t SatpManager::RecoverPendingSessions() {
  std::size_t resumed = 0;
  for (const auto& session : store_->ListNonTerminal()) {
    if (registry_.IsRunning(session.session_id)) {
      continue;
    }
    try {
      Resume(session.session_id);
      ++resumed;
    } catch (const util::SessionBusyError&) {
      // picked up by a concurrent caller
    }
  }
  SATP_LOG_INFO("pending sessions resubmitted", {observability::IntField("count", static_cast<std::int64_t>(resumed))});
  return resumed;
}

bool SatpManager::Deliver(const CounterpartyMessage& message) {
  const auto& id = message.session_id;

  if (message.type == CounterpartyMessage::Type::kAbort) {
    if (registry_.RequestAbort(id)) {
      SATP_LOG_INFO("abort flagged on running session", {StringField("session_id", id), StringField("reason", message.reason)});
      return true;
    }

    auto stored = store_->Find(id);
    if (!stored || model::IsTerminal(stored->status)) {
      return false;
    }

    // the flag is written under the guard so no run can start in between
    std::optional<SessionRegistry::Guard> guard;
    try {
      guard.emplace(registry_.TryAcquire(id));
    } catch (const util::SessionBusyError&) {
      return registry_.RequestAbort(id);
    }

    model::SessionData flagged;
    try {
      flagged = store_->Update(id, [](model::SessionData& session) { session.abort_requested = true; });
    } catch (const util::InvalidStateError&) {
      // finished between the lookup and the guard
      return false;
    }
    registry_.Record(flagged);
    SATP_LOG_INFO("abort recorded on idle session", {StringField("session_id", id), StringField("reason", message.reason)});
    Schedule(std::move(*guard), std::move(flagged));
    return true;
  } else {
    if (registry_.IsRunning(id)) {
      return false;
    }
    auto stored = store_->Find(id);
    if (!stored || model::IsTerminal(stored->status)) {
      return false;
    }
  }

  try {
    Resume(id);
  } catch (const util::SessionBusyError&) {
    return false;
  }
  return true;
}

SessionRegistry& SatpManager::Sessions() {
  return registry_;
}

const SessionRegistry& SatpManager::Sessions() const {
  return registry_;
}

void SatpManager::Shutdown() {
  sleeper_->Cancel();
  workers_->Stop();
}

} // namespace satp::core
