#pragma once

#include <chrono>
#include <cstdint>

namespace snapmig::util {

// Wall clock used to stamp cursor updates.

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMillis();

} // namespace snapmig::util
