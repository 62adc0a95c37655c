#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace satp::testing {

/*
  Forwards to another repository and runs a one-shot callback right before
  the next GetSession or UpdateSession. Tests use it to land a competing
  writer at an exact point of an operation.
*/
class InterposingRepository final : public db::Repository {
 public:
  explicit InterposingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void BeforeNextGet(std::function<void()> fn) {
    std::lock_guard lock(mutex_);
    before_get_ = std::move(fn);
  }

  void BeforeNextUpdate(std::function<void()> fn) {
    std::lock_guard lock(mutex_);
    before_update_ = std::move(fn);
  }

  db::Repository& Inner() {
    return *inner_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertSession(db::Transaction& tx, const db::model::SessionRecord& r) override {
    return inner_->InsertSession(tx, r);
  }

  std::optional<db::model::SessionRecord> GetSession(db::Transaction& tx, const std::string& id) override {
    Fire(before_get_);
    return inner_->GetSession(tx, id);
  }

  db::Result UpdateSession(db::Transaction& tx, const db::model::SessionRecord& r, uint64_t expected_version) override {
    Fire(before_update_);
    return inner_->UpdateSession(tx, r, expected_version);
  }

  db::Result DeleteSession(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteSession(tx, id);
  }

  std::vector<db::model::SessionRecord> ListSessions(db::Transaction& tx, bool include_terminal) override {
    return inner_->ListSessions(tx, include_terminal);
  }

  db::Result InsertAudit(db::Transaction& tx, const db::model::SessionAuditRecord& r) override {
    return inner_->InsertAudit(tx, r);
  }

  std::vector<db::model::SessionAuditRecord> GetAuditTrail(db::Transaction& tx, const std::string& id) override {
    return inner_->GetAuditTrail(tx, id);
  }

 private:
  // the callback runs outside the lock so it may call back into the repository
  void Fire(std::function<void()>& slot) {
    std::function<void()> fn;
    {
      std::lock_guard lock(mutex_);
      fn = std::move(slot);
      slot = nullptr;
    }
    if (fn) fn();
  }

  std::shared_ptr<db::Repository> inner_;
  std::mutex                      mutex_;
  std::function<void()>           before_get_;
  std::function<void()>           before_update_;
};

} // namespace satp::testing
