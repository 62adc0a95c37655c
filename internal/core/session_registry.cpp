#include "internal/core/session_registry.hpp"

#include "internal/util/errors.hpp"

namespace satp::core {

SessionRegistry::Guard::Guard(SessionRegistry* registry, std::string session_id, std::shared_ptr<std::atomic<bool>> abort)
    : registry_(registry), session_id_(std::move(session_id)), abort_(std::move(abort)) {
}

SessionRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(other.registry_), session_id_(std::move(other.session_id_)), abort_(std::move(other.abort_)) {
  other.registry_ = nullptr;
}

SessionRegistry::Guard::~Guard() {
  if (registry_) registry_->Release(session_id_);
}

SessionRegistry::Guard SessionRegistry::TryAcquire(const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto& slot = sessions_[session_id];
  if (slot.entry.running) {
    throw util::SessionBusyError(session_id);
  }

  slot.entry.session_id  = session_id;
  slot.entry.running     = true;
  slot.entry.last_change = std::chrono::system_clock::now();
  slot.abort             = std::make_shared<std::atomic<bool>>(false);
  return Guard(this, session_id, slot.abort);
}

void SessionRegistry::Release(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  if (auto it = sessions_.find(session_id); it != sessions_.end()) {
    it->second.entry.running     = false;
    it->second.entry.last_change = std::chrono::system_clock::now();
  }
}

void SessionRegistry::Record(const model::SessionData& session) {
  std::lock_guard lock(mutex_);
  auto&           slot = sessions_[session.session_id];
  slot.entry.session_id  = session.session_id;
  slot.entry.stage       = session.stage;
  slot.entry.status      = session.status;
  slot.entry.last_change = std::chrono::system_clock::now();
}

bool SessionRegistry::RequestAbort(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end() || !it->second.entry.running || !it->second.abort) {
    return false;
  }
  it->second.abort->store(true);
  return true;
}

bool SessionRegistry::Has(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return sessions_.contains(session_id);
}

bool SessionRegistry::IsRunning(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  return it != sessions_.end() && it->second.entry.running;
}

std::optional<SessionRegistry::Entry> SessionRegistry::Get(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second.entry;
}

std::vector<SessionRegistry::Entry> SessionRegistry::List() const {
  std::lock_guard    lock(mutex_);
  std::vector<Entry> out;
  out.reserve(sessions_.size());
  for (const auto& [_, slot] : sessions_) {
    out.push_back(slot.entry);
  }
  return out;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void SessionRegistry::Remove(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it == sessions_.end()) return;
  if (it->second.entry.running) {
    throw util::InvalidStateError("session " + session_id + " is executing and cannot be removed");
  }
  sessions_.erase(it);
}

void SessionRegistry::Clear() {
  std::lock_guard lock(mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (it->second.entry.running) {
      ++it;
    } else {
      it = sessions_.erase(it);
    }
  }
}

} // namespace satp::core
