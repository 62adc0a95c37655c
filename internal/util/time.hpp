#pragma once

#include <chrono>
#include <cstdint>

namespace satp::util {

/*
  Time utilities. Single place to control the wall clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace satp::util
