#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "internal/core/session_registry.hpp"
#include "internal/core/transfer_queue.hpp"
#include "internal/core/transfer_state_machine.hpp"
#include "internal/core/transfer_worker.hpp"
#include "internal/model/session.hpp"
#include "internal/retry/clock.hpp"
#include "internal/store/session_store.hpp"

namespace satp::core {

// Inbound message from the counterparty gateway.
struct CounterpartyMessage {
  enum class Type { kAbort, kResume };

  std::string session_id;
  Type        type = Type::kAbort;
  std::string reason;
};

/*
  SatpManager

  Owns the worker pool and the session registry. Transfer() persists a new
  session (or picks up the stored one) and schedules it; the returned
  future yields the completed session or a util::TransactError.

  - A second Transfer() for a session that is executing throws
    util::SessionBusyError before anything is read or written.
  - Terminal sessions short-circuit: no ledger call, the recorded outcome
    is returned (SUCCESS) or rethrown (ROLLED_BACK, FAILED).
  - Shutdown() cancels backoff waits; interrupted sessions stay persisted
    and RecoverPendingSessions() picks them up again.
*/
class SatpManager {
 public:
  struct Options {
    std::size_t worker_threads = 4;
  };

  SatpManager(std::shared_ptr<store::SessionStore> store, std::shared_ptr<TransferStateMachine> machine,
              std::shared_ptr<retry::Sleeper> sleeper, Options options);
  ~SatpManager();

  SatpManager(const SatpManager&)            = delete;
  SatpManager& operator=(const SatpManager&) = delete;

  std::future<model::SessionData> Transfer(model::SessionData session);
  std::future<model::SessionData> Resume(const std::string& session_id);

  // Resubmits stored non-terminal sessions that are not executing here.
  std::size_t RecoverPendingSessions();

  // true when the message was routed to a session
  bool Deliver(const CounterpartyMessage& message);

  SessionRegistry&       Sessions();
  const SessionRegistry& Sessions() const;

  void Shutdown();

 private:
  std::future<model::SessionData> Schedule(SessionRegistry::Guard guard, model::SessionData session);

  std::shared_ptr<store::SessionStore>  store_;
  std::shared_ptr<TransferStateMachine> machine_;
  std::shared_ptr<retry::Sleeper>       sleeper_;

  SessionRegistry                     registry_;
  std::shared_ptr<TransferQueue>      queue_;
  std::unique_ptr<TransferWorkerPool> workers_;
  std::atomic<std::int64_t>           active_{0};
};

} // namespace satp::core
