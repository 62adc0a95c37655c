#include <cassert>
#include <iostream>
#include <optional>

#include "internal/core/session_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using satp::core::SessionRegistry;

void TestSecondAcquireIsBusy() {
  SessionRegistry registry;

  auto guard = registry.TryAcquire("s-1");
  assert(registry.IsRunning("s-1"));

  bool busy = false;
  try {
    auto second = registry.TryAcquire("s-1");
  } catch (const satp::util::SessionBusyError& e) {
    busy = e.SessionId() == "s-1";
  }
  assert(busy);

  // other sessions are independent
  auto other = registry.TryAcquire("s-2");
  assert(registry.IsRunning("s-2"));
}

void TestReleaseKeepsEntry() {
  SessionRegistry registry;
  {
    auto guard = registry.TryAcquire("s-1");
  }
  assert(registry.Has("s-1"));
  assert(!registry.IsRunning("s-1"));

  auto again = registry.TryAcquire("s-1");
  assert(registry.IsRunning("s-1"));
}

void TestMovedGuardReleasesOnce() {
  SessionRegistry registry;
  std::optional<SessionRegistry::Guard> holder;
  {
    auto guard = registry.TryAcquire("s-1");
    holder.emplace(std::move(guard));
  }
  assert(registry.IsRunning("s-1"));
  holder.reset();
  assert(!registry.IsRunning("s-1"));
}

void TestRecordTracksOutcome() {
  SessionRegistry registry;

  satp::model::SessionData session;
  session.session_id = "s-1";
  session.stage      = satp::model::Stage::kCompleted;
  session.status     = satp::model::SessionStatus::kSuccess;
  registry.Record(session);

  auto entry = registry.Get("s-1");
  assert(entry.has_value());
  assert(entry->stage == satp::model::Stage::kCompleted);
  assert(entry->status == satp::model::SessionStatus::kSuccess);
  assert(!entry->running);
  assert(registry.List().size() == 1);
}

void TestAbortOnlyReachesRunningSessions() {
  SessionRegistry registry;
  assert(!registry.RequestAbort("missing"));

  auto guard = registry.TryAcquire("s-1");
  assert(!guard.AbortRequested());
  assert(registry.RequestAbort("s-1"));
  assert(guard.AbortRequested());
}

void TestRemoveRefusesRunningSession() {
  SessionRegistry registry;
  {
    auto guard = registry.TryAcquire("s-1");

    bool refused = false;
    try {
      registry.Remove("s-1");
    } catch (const satp::util::InvalidStateError&) {
      refused = true;
    }
    assert(refused);

    auto idle = registry.TryAcquire("s-2");
  }

  registry.Remove("s-1");
  assert(!registry.Has("s-1"));
  assert(registry.Has("s-2"));

  auto running = registry.TryAcquire("s-3");
  registry.Clear();
  assert(!registry.Has("s-2"));
  assert(registry.Has("s-3"));
  assert(registry.Size() == 1);
}

} // namespace

int main() {
  TestSecondAcquireIsBusy();
  TestReleaseKeepsEntry();
  TestMovedGuardReleasesOnce();
  TestRecordTracksOutcome();
  TestAbortOnlyReachesRunningSessions();
  TestRemoveRefusesRunningSession();

  std::cout << "session_registry_test: pass\n";
  return 0;
}
