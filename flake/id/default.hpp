/*
 * default.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Process-wide default snowflake generators

**************************************************/

#ifndef FLAKE_ID_DEFAULT_HPP
#define FLAKE_ID_DEFAULT_HPP

#include <string>

#include "flake/id/config.hpp"
#include "flake/id/snowflake.hpp"

namespace flake::id {

/*
 * Lifecycle of the default generators: each is created at most once per
 * process, handed out by reference to every caller, and lives until process
 * exit. There is no teardown or re-initialization.
 */

/**
 * @brief Creates the process-wide default generator from config.
 *
 * Calling again with an equal config returns the existing generator.
 *
 * @throws SnowflakeException If the default generator already exists with a
 * different config.
 * @throws InvalidCenterIdException, InvalidWorkerIdException If config is
 * out of range; the default generator is then left uninitialized.
 */
auto initDefaultGenerator(const NodeConfig &config) -> Snowflake &;

/**
 * @brief Returns the default generator, creating it from
 * NodeConfig::builtin() if initDefaultGenerator() was never called.
 */
[[nodiscard]] auto defaultGenerator() -> Snowflake &;

/**
 * @brief Returns the process-wide generator built from
 * NodeConfig::dynamic(), creating it on first use.
 */
[[nodiscard]] auto dynamicGenerator() -> Snowflake &;

/**
 * @brief Next id of the default generator.
 */
[[nodiscard]] auto nextId() -> u64;

[[nodiscard]] auto nextIdString() -> std::string;

/**
 * @brief Next id of the dynamic generator.
 */
[[nodiscard]] auto dynamicNextId() -> u64;

[[nodiscard]] auto dynamicNextIdString() -> std::string;

}  // namespace flake::id

#endif  // FLAKE_ID_DEFAULT_HPP
