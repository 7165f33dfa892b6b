/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Exceptions raised by the snowflake generator

**************************************************/

#ifndef FLAKE_ID_EXCEPTION_HPP
#define FLAKE_ID_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include "flake/id/numeric.hpp"

namespace flake::id {

/**
 * @brief Failure categories reported by the generator.
 */
enum class ErrorKind {
    CenterIdInvalid,
    WorkerIdInvalid,
    SystemTimeError,
    ClockMovedBackwards,
    ConfigInvalid,
};

[[nodiscard]] constexpr auto toString(ErrorKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case ErrorKind::CenterIdInvalid:
            return "CenterIdInvalid";
        case ErrorKind::WorkerIdInvalid:
            return "WorkerIdInvalid";
        case ErrorKind::SystemTimeError:
            return "SystemTimeError";
        case ErrorKind::ClockMovedBackwards:
            return "ClockMovedBackwards";
        case ErrorKind::ConfigInvalid:
            return "ConfigInvalid";
    }
    return "Unknown";
}

/**
 * @brief Base class for all snowflake errors.
 */
class SnowflakeException : public std::runtime_error {
public:
    SnowflakeException(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Thrown when the configured center id exceeds the maximum.
 */
class InvalidCenterIdException : public SnowflakeException {
public:
    InvalidCenterIdException(u64 center_id, u64 max)
        : SnowflakeException(ErrorKind::CenterIdInvalid,
                             "Center ID " + std::to_string(center_id) +
                                 " exceeds maximum of " + std::to_string(max)) {
    }
};

/**
 * @brief Thrown when the configured worker id exceeds the maximum.
 */
class InvalidWorkerIdException : public SnowflakeException {
public:
    InvalidWorkerIdException(u64 worker_id, u64 max)
        : SnowflakeException(ErrorKind::WorkerIdInvalid,
                             "Worker ID " + std::to_string(worker_id) +
                                 " exceeds maximum of " + std::to_string(max)) {
    }
};

/**
 * @brief Thrown when the system clock reads earlier than the Unix epoch.
 */
class SystemTimeException : public SnowflakeException {
public:
    explicit SystemTimeException(i64 millis)
        : SnowflakeException(ErrorKind::SystemTimeError,
                             "System time " + std::to_string(millis) +
                                 "ms is before the Unix epoch") {}
};

/**
 * @brief Thrown when the clock is behind the last issued timestamp and did
 * not catch up within the tolerated wait.
 */
class ClockMovedBackwardsException : public SnowflakeException {
public:
    ClockMovedBackwardsException(u64 timestamp, u64 last_timestamp)
        : SnowflakeException(
              ErrorKind::ClockMovedBackwards,
              "Clock moved backwards by " +
                  std::to_string(last_timestamp - timestamp) +
                  "ms. Refusing to generate id"),
          timestamp_(timestamp),
          last_timestamp_(last_timestamp) {}

    [[nodiscard]] auto timestamp() const noexcept -> u64 { return timestamp_; }
    [[nodiscard]] auto lastTimestamp() const noexcept -> u64 {
        return last_timestamp_;
    }

private:
    u64 timestamp_;
    u64 last_timestamp_;
};

/**
 * @brief Thrown when node configuration cannot be parsed.
 */
class ConfigException : public SnowflakeException {
public:
    explicit ConfigException(const std::string &message)
        : SnowflakeException(ErrorKind::ConfigInvalid, message) {}
};

}  // namespace flake::id

#endif  // FLAKE_ID_EXCEPTION_HPP
