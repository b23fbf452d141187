#pragma once

#include <chrono>
#include <cstdint>

namespace swarm::util {

/*
  Wall clock helpers. Every timestamp the engine stores goes through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t NowMillis();

} // namespace swarm::util
