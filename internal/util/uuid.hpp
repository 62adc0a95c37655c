#pragma once

#include <string>

namespace satp::util {

// Random RFC4122 version 4 id, used when a Transact request names no session.
std::string NewSessionId();

} // namespace satp::util
