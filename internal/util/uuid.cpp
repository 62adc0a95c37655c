#include "uuid.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <random>

namespace satp::util {

std::string NewSessionId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  // version nibble 4 in the high word, RFC4122 variant bits in the low word
  const uint64_t high = (rng() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  const uint64_t low  = (rng() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  char buffer[37];
  std::snprintf(buffer, sizeof(buffer), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%04" PRIx64 "-%012" PRIx64, high >> 32, (high >> 16) & 0xFFFF,
                high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
  return buffer;
}

} // namespace satp::util
