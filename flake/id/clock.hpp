/*
 * clock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Millisecond wall-clock sources for the snowflake generator

**************************************************/

#ifndef FLAKE_ID_CLOCK_HPP
#define FLAKE_ID_CLOCK_HPP

#include <memory>

#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief Source of wall-clock time in milliseconds.
 *
 * The generator reads time and performs its bounded waits only through this
 * interface, so alternative sources can replace the system clock.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /**
     * @brief Returns the current time in milliseconds since the Unix epoch.
     * @throws SystemTimeException If the clock reads before the Unix epoch.
     */
    [[nodiscard]] virtual auto nowMillis() -> u64 = 0;

    /**
     * @brief Blocks the calling thread for the given number of milliseconds.
     */
    virtual void sleepFor(u64 millis) = 0;
};

/**
 * @brief ClockSource backed by std::chrono::system_clock.
 */
class SystemClockSource final : public ClockSource {
public:
    [[nodiscard]] auto nowMillis() -> u64 override;
    void sleepFor(u64 millis) override;
};

/**
 * @brief Returns the process-wide system clock source.
 */
[[nodiscard]] auto systemClock() -> std::shared_ptr<ClockSource>;

}  // namespace flake::id

#endif  // FLAKE_ID_CLOCK_HPP
