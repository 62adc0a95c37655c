#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/session.hpp"

namespace satp::core {

/*
  Process-local table of sessions this gateway has seen.

  At most one execution per session id: TryAcquire hands out an exclusive
  Guard or throws util::SessionBusyError. Entries stay after execution
  ends so callers can inspect the outcome; they are dropped with Remove()
  or Clear(). The store remains authoritative; this table is advisory.
*/
class SessionRegistry {
 public:
  struct Entry {
    std::string                           session_id;
    model::Stage                          stage  = model::Stage::kInitiated;
    model::SessionStatus                  status = model::SessionStatus::kInProgress;
    bool                                  running = false;
    std::chrono::system_clock::time_point last_change;
  };

  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&)       = delete;
    ~Guard();

    const std::string& SessionId() const {
      return session_id_;
    }

    bool AbortRequested() const {
      return abort_->load();
    }

   private:
    friend class SessionRegistry;
    Guard(SessionRegistry* registry, std::string session_id, std::shared_ptr<std::atomic<bool>> abort);

    SessionRegistry*                   registry_;
    std::string                        session_id_;
    std::shared_ptr<std::atomic<bool>> abort_;
  };

  Guard TryAcquire(const std::string& session_id);

  void Record(const model::SessionData& session);

  // true when the session is executing and the abort was flagged
  bool RequestAbort(const std::string& session_id);

  bool                 Has(const std::string& session_id) const;
  bool                 IsRunning(const std::string& session_id) const;
  std::optional<Entry> Get(const std::string& session_id) const;
  std::vector<Entry>   List() const;
  std::size_t          Size() const;

  // util::InvalidStateError while the session is executing
  void Remove(const std::string& session_id);

  // Drops every entry that is not executing.
  void Clear();

 private:
  struct Slot {
    Entry                              entry;
    std::shared_ptr<std::atomic<bool>> abort;
  };

  void Release(const std::string& session_id);

  mutable std::mutex                    mutex_;
  std::unordered_map<std::string, Slot> sessions_;
};

} // namespace satp::core
