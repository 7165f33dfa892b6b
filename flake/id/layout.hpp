/*
 * layout.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Bit layout of a 64-bit snowflake identifier

**************************************************/

#ifndef FLAKE_ID_LAYOUT_HPP
#define FLAKE_ID_LAYOUT_HPP

#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief The decoded fields of a snowflake identifier.
 */
struct IdParts {
    /**
     * @brief Absolute timestamp in milliseconds since the Unix epoch.
     */
    u64 timestamp;
    u64 center_id;
    u64 worker_id;
    u64 sequence;

    auto operator==(const IdParts &) const -> bool = default;
};

/**
 * @brief Fixed partition of the 64-bit identifier.
 *
 * From the most significant end: 1 reserved sign bit, 41 bits of
 * milliseconds since EPOCH, 5 bits of center id, 5 bits of worker id and
 * 12 bits of per-millisecond sequence.
 */
struct Layout {
    /**
     * @brief Custom epoch, 2023-04-05 06:07:08 UTC, in Unix milliseconds.
     */
    static constexpr u64 EPOCH = 1680646028000ULL;

    static constexpr u64 CENTER_ID_BITS = 5;
    static constexpr u64 WORKER_ID_BITS = 5;
    static constexpr u64 SEQUENCE_BITS = 12;
    static constexpr u64 TIMESTAMP_BITS = 41;

    static constexpr u64 MAX_CENTER_ID = (1ULL << CENTER_ID_BITS) - 1;
    static constexpr u64 MAX_WORKER_ID = (1ULL << WORKER_ID_BITS) - 1;
    static constexpr u64 SEQUENCE_MASK = (1ULL << SEQUENCE_BITS) - 1;
    static constexpr u64 TIMESTAMP_MASK = (1ULL << TIMESTAMP_BITS) - 1;

    static constexpr u64 WORKER_ID_SHIFT = SEQUENCE_BITS;
    static constexpr u64 CENTER_ID_SHIFT = SEQUENCE_BITS + WORKER_ID_BITS;
    static constexpr u64 TIMESTAMP_SHIFT =
        SEQUENCE_BITS + WORKER_ID_BITS + CENTER_ID_BITS;

    static constexpr u64 DEFAULT_CENTER_ID = 1;
    static constexpr u64 DEFAULT_WORKER_ID = 1;

    /**
     * @brief Packs the four fields into an identifier.
     *
     * @param timestamp Absolute Unix milliseconds, not before EPOCH.
     * @param center_id Center id, at most MAX_CENTER_ID.
     * @param worker_id Worker id, at most MAX_WORKER_ID.
     * @param sequence Sequence, at most SEQUENCE_MASK.
     */
    [[nodiscard]] static constexpr auto compose(u64 timestamp, u64 center_id,
                                                u64 worker_id,
                                                u64 sequence) noexcept -> u64 {
        return ((timestamp - EPOCH) << TIMESTAMP_SHIFT) |
               (center_id << CENTER_ID_SHIFT) |
               (worker_id << WORKER_ID_SHIFT) | sequence;
    }

    [[nodiscard]] static constexpr auto extractTimestamp(u64 id) noexcept
        -> u64 {
        return ((id >> TIMESTAMP_SHIFT) & TIMESTAMP_MASK) + EPOCH;
    }

    [[nodiscard]] static constexpr auto extractCenterId(u64 id) noexcept
        -> u64 {
        return (id >> CENTER_ID_SHIFT) & MAX_CENTER_ID;
    }

    [[nodiscard]] static constexpr auto extractWorkerId(u64 id) noexcept
        -> u64 {
        return (id >> WORKER_ID_SHIFT) & MAX_WORKER_ID;
    }

    [[nodiscard]] static constexpr auto extractSequence(u64 id) noexcept
        -> u64 {
        return id & SEQUENCE_MASK;
    }

    /**
     * @brief Inverse of compose().
     */
    [[nodiscard]] static constexpr auto decompose(u64 id) noexcept -> IdParts {
        return IdParts{extractTimestamp(id), extractCenterId(id),
                       extractWorkerId(id), extractSequence(id)};
    }
};

static_assert(Layout::TIMESTAMP_BITS + Layout::CENTER_ID_BITS +
                      Layout::WORKER_ID_BITS + Layout::SEQUENCE_BITS ==
                  63,
              "identifier fields must fill the 63 non-sign bits");
static_assert(Layout::TIMESTAMP_SHIFT + Layout::TIMESTAMP_BITS == 63,
              "timestamp must end below the sign bit");
static_assert(Layout::MAX_CENTER_ID == 31 && Layout::MAX_WORKER_ID == 31 &&
                  Layout::SEQUENCE_MASK == 4095,
              "unexpected field widths");

}  // namespace flake::id

#endif  // FLAKE_ID_LAYOUT_HPP
