/*
 * node.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Derive snowflake node ids from host identity

**************************************************/

#ifndef FLAKE_SYSTEM_NODE_HPP
#define FLAKE_SYSTEM_NODE_HPP

#include <array>
#include <optional>

#include "flake/id/numeric.hpp"

namespace flake::system {

using id::u64;
using id::u8;

using HardwareAddress = std::array<u8, 6>;

/**
 * @brief Returns the hardware (MAC) address of the first non-loopback
 * network interface.
 *
 * @return std::nullopt when no such interface exists, the address cannot
 * be queried, or the platform is not Linux.
 */
[[nodiscard]] auto getHardwareAddress() -> std::optional<HardwareAddress>;

/**
 * @brief Returns the id of the current process.
 */
[[nodiscard]] auto currentProcessId() -> u64;

/**
 * @brief Maps a hardware address onto [0, max_center_id] using its two last
 * bytes.
 */
[[nodiscard]] constexpr auto centerIdFromHardwareAddress(
    const HardwareAddress &mac, u64 max_center_id) noexcept -> u64 {
    const u64 low = mac[mac.size() - 2];
    const u64 high = static_cast<u64>(mac[mac.size() - 1]) << 8;
    const u64 id = ((0x000000FFULL & low) | (0x0000FF00ULL & high)) >> 6;
    return id % (max_center_id + 1);
}

/**
 * @brief Maps a (center id, process id) pair onto [0, max_worker_id].
 */
[[nodiscard]] auto workerIdFromProcess(u64 center_id, u64 pid,
                                       u64 max_worker_id) -> u64;

/**
 * @brief Derives a center id from this host's hardware address, falling back
 * to the builtin default when none is available.
 */
[[nodiscard]] auto deriveCenterId(u64 max_center_id) -> u64;

/**
 * @brief Derives a worker id from center_id and the current process id.
 */
[[nodiscard]] auto deriveWorkerId(u64 center_id, u64 max_worker_id) -> u64;

}  // namespace flake::system

#endif  // FLAKE_SYSTEM_NODE_HPP
