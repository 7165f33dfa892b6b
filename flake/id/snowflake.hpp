/*
 * snowflake.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Thread-safe snowflake identifier generator

**************************************************/

#ifndef FLAKE_ID_SNOWFLAKE_HPP
#define FLAKE_ID_SNOWFLAKE_HPP

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "flake/id/clock.hpp"
#include "flake/id/config.hpp"
#include "flake/id/exception.hpp"
#include "flake/id/layout.hpp"
#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief A class for generating unique IDs using the Snowflake algorithm.
 *
 * Each id packs the milliseconds elapsed since Layout::EPOCH, the center id,
 * the worker id and a per-millisecond sequence number (see Layout). IDs
 * issued by one instance are strictly increasing. Two instances produce
 * disjoint ids only when their (center id, worker id) pairs differ.
 *
 * All public members are safe to call concurrently. A single mutex
 * serializes the read-compare-update of the (last timestamp, sequence)
 * pair.
 */
class Snowflake {
public:
    /**
     * @brief Largest clock regression, in milliseconds, that is waited out
     * instead of failing immediately.
     */
    static constexpr u64 MAX_BACKWARD_MILLIS = 8;

    /**
     * @brief A tolerated regression of delta milliseconds sleeps for
     * BACKWARD_WAIT_FACTOR * delta before the clock is read again.
     */
    static constexpr u64 BACKWARD_WAIT_FACTOR = 2;

    /**
     * @brief Constructs a Snowflake ID generator.
     *
     * @param center_id The id of the center hosting this node. Must be less
     * than or equal to Layout::MAX_CENTER_ID.
     * @param worker_id The id of this node within its center. Must be less
     * than or equal to Layout::MAX_WORKER_ID.
     * @param clock Time source; the system clock when null.
     * @throws InvalidCenterIdException If center_id is out of range.
     * @throws InvalidWorkerIdException If worker_id is out of range.
     */
    Snowflake(u64 center_id, u64 worker_id,
              std::shared_ptr<ClockSource> clock = nullptr);

    /**
     * @brief Constructs a generator from a node configuration.
     */
    explicit Snowflake(const NodeConfig &config,
                       std::shared_ptr<ClockSource> clock = nullptr);

    Snowflake(const Snowflake &) = delete;
    auto operator=(const Snowflake &) -> Snowflake & = delete;

    /**
     * @brief Generates the next unique ID.
     *
     * @return A new ID, greater than every ID previously returned by this
     * instance.
     * @throws ClockMovedBackwardsException If the clock is behind the last
     * issued timestamp by more than MAX_BACKWARD_MILLIS, or is still behind
     * after the compensating wait.
     * @throws SystemTimeException If the clock reads before the Unix epoch.
     */
    [[nodiscard]] auto nextId() -> u64;

    /**
     * @brief Generates the next unique ID in decimal form.
     */
    [[nodiscard]] auto nextIdString() -> std::string;

    /**
     * @brief Generates a batch of unique IDs under a single lock.
     *
     * If generation fails partway, the IDs already issued by this call are
     * consumed and not returned.
     *
     * @param count Number of IDs to generate.
     * @return The IDs in issuance order.
     * @throws ClockMovedBackwardsException As for nextId().
     * @throws SystemTimeException As for nextId().
     */
    [[nodiscard]] auto nextIds(usize count) -> std::vector<u64>;

    /**
     * @brief Generates a fixed-size batch of unique IDs under a single lock.
     */
    template <usize N>
    [[nodiscard]] auto nextIds() -> std::array<u64, N> {
        std::array<u64, N> ids{};
        std::lock_guard lock(mutex_);
        for (auto &id : ids) {
            id = generateLocked();
        }
        return ids;
    }

    /**
     * @brief Reads the current wall-clock time from the clock source.
     *
     * @return Milliseconds since the Unix epoch.
     * @throws SystemTimeException If the clock reads before the Unix epoch.
     */
    [[nodiscard]] auto currentTimeMillis() const -> u64;

    /**
     * @brief Spins on the clock until it is strictly later than
     * last_timestamp.
     *
     * @param last_timestamp The timestamp to move past.
     * @return The first clock reading greater than last_timestamp.
     */
    [[nodiscard]] auto waitForNextMillis(u64 last_timestamp) const -> u64;

    /**
     * @brief Checks whether an ID carries this instance's center and worker
     * ids and a timestamp that is not in the future.
     *
     * @throws SystemTimeException If the clock reads before the Unix epoch.
     */
    [[nodiscard]] auto validateId(u64 id) const -> bool;

    /**
     * @brief Splits an ID into its timestamp, center id, worker id and
     * sequence.
     */
    [[nodiscard]] static constexpr auto parseId(u64 id) noexcept -> IdParts {
        return Layout::decompose(id);
    }

    /**
     * @brief Extracts the absolute timestamp (Unix milliseconds) of an ID.
     */
    [[nodiscard]] static constexpr auto extractTimestamp(u64 id) noexcept
        -> u64 {
        return Layout::extractTimestamp(id);
    }

    [[nodiscard]] auto getCenterId() const noexcept -> u64 {
        return center_id_;
    }
    [[nodiscard]] auto getWorkerId() const noexcept -> u64 {
        return worker_id_;
    }

    /**
     * @brief Counters describing the generator's history.
     */
    struct Statistics {
        /**
         * @brief The total number of IDs generated by this instance.
         */
        u64 total_ids_generated;

        /**
         * @brief The number of times the sequence space of a millisecond
         * was exhausted.
         */
        u64 sequence_rollovers;

        /**
         * @brief The number of clock reads spent waiting for the next
         * millisecond.
         */
        u64 timestamp_wait_count;

        /**
         * @brief The number of times the clock was observed behind the last
         * issued timestamp.
         */
        u64 clock_regressions;
    };

    [[nodiscard]] auto getStatistics() const -> Statistics;

private:
    // Requires mutex_ held.
    auto generateLocked() -> u64;

    auto spinUntilAfter(u64 last_timestamp, u64 &reads) const -> u64;

    const u64 center_id_;
    const u64 worker_id_;
    std::shared_ptr<ClockSource> clock_;

    mutable std::mutex mutex_;
    u64 sequence_ = 0;
    u64 last_timestamp_ = 0;
    Statistics statistics_{};
};

}  // namespace flake::id

#endif  // FLAKE_ID_SNOWFLAKE_HPP
