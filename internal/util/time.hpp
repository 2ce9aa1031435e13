#pragma once

#include <chrono>
#include <cstdint>

namespace relations::util {

/*
  Time utilities, single place to control clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// origin_server_ts for newly persisted events
uint64_t NowMillis();

} // namespace relations::util
