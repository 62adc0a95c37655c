#pragma once

#include <cstdint>
#include <string>

namespace satp::db::model {

/*
  Persistent session row.

  - data holds the JSON form of satp.gateway.v1.SessionData and is
    authoritative; stage/status are denormalized for recovery scans.
  - version is the optimistic concurrency token.
*/
struct SessionRecord {
  std::string session_id;
  uint32_t    stage         = 0;
  uint32_t    status        = 0;
  uint64_t    version       = 0;
  uint64_t    updated_at_ms = 0;
  std::string data;
};

// Append-only terminal outcome written before a session may be deleted.
struct SessionAuditRecord {
  std::string session_id;
  uint32_t    status = 0;
  uint32_t    stage  = 0;
  std::string last_error;
  std::string data;
  uint64_t    recorded_at_ms = 0;
};

} // namespace satp::db::model
