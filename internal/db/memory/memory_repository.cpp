#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace satp::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.session_id)) return Result::Err(ErrorCode::AlreadyExists, r.session_id);
  s.sessions[r.session_id] = r;
  TX(t).TouchSession(r.session_id);
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r, uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.session_id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, r.session_id);
  if (it->second.version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "stored version " + std::to_string(it->second.version) + ", expected " + std::to_string(expected_version));
  }
  it->second = r;
  TX(t).TouchSession(r.session_id);
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.sessions.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  TX(t).TouchSession(id);
  return Result::Ok();
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t, bool include_terminal) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : s.sessions) {
    if (include_terminal || !IsTerminalStatus(record.status)) {
      records.push_back(record);
    }
  }
  return records;
}

Result MemoryRepository::InsertAudit(Transaction& t, const model::SessionAuditRecord& r) {
  TX(t).Mutable().audit[r.session_id].push_back(r);
  TX(t).TouchAudit(r.session_id);
  return Result::Ok();
}

std::vector<model::SessionAuditRecord> MemoryRepository::GetAuditTrail(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.audit.find(id);
  if (it == s.audit.end()) return {};
  return it->second;
}

} // namespace satp::db::memory
