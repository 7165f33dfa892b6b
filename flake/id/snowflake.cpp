/*
 * snowflake.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Thread-safe snowflake identifier generator

**************************************************/

#include "snowflake.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace flake::id {

Snowflake::Snowflake(u64 center_id, u64 worker_id,
                     std::shared_ptr<ClockSource> clock)
    : center_id_(center_id),
      worker_id_(worker_id),
      clock_(clock ? std::move(clock) : systemClock()) {
    if (center_id_ > Layout::MAX_CENTER_ID) {
        spdlog::error("Rejecting center id {} (max {})", center_id_,
                      Layout::MAX_CENTER_ID);
        throw InvalidCenterIdException(center_id_, Layout::MAX_CENTER_ID);
    }
    if (worker_id_ > Layout::MAX_WORKER_ID) {
        spdlog::error("Rejecting worker id {} (max {})", worker_id_,
                      Layout::MAX_WORKER_ID);
        throw InvalidWorkerIdException(worker_id_, Layout::MAX_WORKER_ID);
    }
    spdlog::debug("Snowflake generator created: center_id={}, worker_id={}",
                  center_id_, worker_id_);
}

Snowflake::Snowflake(const NodeConfig &config,
                     std::shared_ptr<ClockSource> clock)
    : Snowflake(config.center_id, config.worker_id, std::move(clock)) {}

auto Snowflake::nextId() -> u64 {
    std::lock_guard lock(mutex_);
    return generateLocked();
}

auto Snowflake::nextIdString() -> std::string {
    return std::to_string(nextId());
}

auto Snowflake::nextIds(usize count) -> std::vector<u64> {
    std::vector<u64> ids;
    ids.reserve(count);
    std::lock_guard lock(mutex_);
    for (usize i = 0; i < count; ++i) {
        ids.push_back(generateLocked());
    }
    return ids;
}

auto Snowflake::currentTimeMillis() const -> u64 { return clock_->nowMillis(); }

auto Snowflake::waitForNextMillis(u64 last_timestamp) const -> u64 {
    u64 reads = 0;
    return spinUntilAfter(last_timestamp, reads);
}

auto Snowflake::spinUntilAfter(u64 last_timestamp, u64 &reads) const -> u64 {
    u64 timestamp = clock_->nowMillis();
    while (timestamp <= last_timestamp) {
        timestamp = clock_->nowMillis();
        ++reads;
    }
    return timestamp;
}

auto Snowflake::generateLocked() -> u64 {
    u64 timestamp = clock_->nowMillis();

    if (timestamp < last_timestamp_) {
        ++statistics_.clock_regressions;
        const u64 delta = last_timestamp_ - timestamp;
        if (delta > MAX_BACKWARD_MILLIS) {
            spdlog::error(
                "Clock moved backwards by {}ms (limit {}ms), refusing to "
                "generate id",
                delta, MAX_BACKWARD_MILLIS);
            throw ClockMovedBackwardsException(timestamp, last_timestamp_);
        }

        spdlog::warn("Clock moved backwards by {}ms, waiting {}ms", delta,
                     delta * BACKWARD_WAIT_FACTOR);
        clock_->sleepFor(delta * BACKWARD_WAIT_FACTOR);
        timestamp = clock_->nowMillis();
        if (timestamp < last_timestamp_) {
            spdlog::error(
                "Clock still {}ms behind after waiting, refusing to generate "
                "id",
                last_timestamp_ - timestamp);
            throw ClockMovedBackwardsException(timestamp, last_timestamp_);
        }
    }

    u64 sequence = 0;
    if (timestamp == last_timestamp_) {
        sequence = sequence_ + 1;
        if (sequence > Layout::SEQUENCE_MASK) {
            spdlog::trace("Sequence exhausted at {}, waiting for next millis",
                          timestamp);
            timestamp =
                spinUntilAfter(timestamp, statistics_.timestamp_wait_count);
            sequence = 0;
            ++statistics_.sequence_rollovers;
        }
    }

    last_timestamp_ = timestamp;
    sequence_ = sequence;
    ++statistics_.total_ids_generated;

    return Layout::compose(timestamp, center_id_, worker_id_, sequence);
}

auto Snowflake::validateId(u64 id) const -> bool {
    const auto parts = Layout::decompose(id);
    return parts.center_id == center_id_ && parts.worker_id == worker_id_ &&
           parts.timestamp <= currentTimeMillis();
}

auto Snowflake::getStatistics() const -> Statistics {
    std::lock_guard lock(mutex_);
    return statistics_;
}

}  // namespace flake::id
