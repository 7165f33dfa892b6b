/*
 * clock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Millisecond wall-clock sources for the snowflake generator

**************************************************/

#include "clock.hpp"

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "flake/id/exception.hpp"

namespace flake::id {

auto SystemClockSource::nowMillis() -> u64 {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    if (millis < 0) {
        spdlog::error("System clock reads {}ms, before the Unix epoch",
                      millis);
        throw SystemTimeException(static_cast<i64>(millis));
    }
    return static_cast<u64>(millis);
}

void SystemClockSource::sleepFor(u64 millis) {
    std::this_thread::sleep_for(std::chrono::milliseconds(millis));
}

auto systemClock() -> std::shared_ptr<ClockSource> {
    static const auto clock = std::make_shared<SystemClockSource>();
    return clock;
}

}  // namespace flake::id
