/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Node identity configuration for snowflake generators

**************************************************/

#ifndef FLAKE_ID_CONFIG_HPP
#define FLAKE_ID_CONFIG_HPP

#include <string>

#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief Environment variable selecting how node ids are resolved:
 * "static" (default) or "dynamic".
 */
inline constexpr const char *ENV_NODE_MODE = "FLAKE_NODE_MODE";
inline constexpr const char *ENV_CENTER_ID = "FLAKE_CENTER_ID";
inline constexpr const char *ENV_WORKER_ID = "FLAKE_WORKER_ID";

/**
 * @brief The (center id, worker id) pair that identifies one generator.
 *
 * Values are not range checked here; Snowflake rejects out-of-range ids at
 * construction.
 */
struct NodeConfig {
    u64 center_id;
    u64 worker_id;

    auto operator==(const NodeConfig &) const -> bool = default;

    /**
     * @brief Layout::DEFAULT_CENTER_ID and Layout::DEFAULT_WORKER_ID.
     */
    [[nodiscard]] static auto builtin() noexcept -> NodeConfig;

    /**
     * @brief Derives both ids from the host's hardware address and the
     * current process id.
     */
    [[nodiscard]] static auto dynamic() -> NodeConfig;

    /**
     * @brief Resolves the configuration from FLAKE_NODE_MODE,
     * FLAKE_CENTER_ID and FLAKE_WORKER_ID.
     *
     * Unset ids fall back to the builtin defaults.
     * @throws ConfigException If a variable holds an unparsable value.
     */
    [[nodiscard]] static auto fromEnvironment() -> NodeConfig;

    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * @brief Parses a decimal node id.
 * @param name Name of the setting, used in error messages.
 * @throws ConfigException If value is empty, not a decimal number or does
 * not fit in 64 bits.
 */
[[nodiscard]] auto parseNodeId(const std::string &name,
                               const std::string &value) -> u64;

}  // namespace flake::id

#endif  // FLAKE_ID_CONFIG_HPP
