/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Node identity configuration for snowflake generators

**************************************************/

#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>

#include <spdlog/spdlog.h>

#include "flake/id/exception.hpp"
#include "flake/id/layout.hpp"
#include "flake/system/node.hpp"

namespace flake::id {

namespace {
auto readEnv(const char *name) -> std::optional<std::string> {
    if (const char *value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}
}  // namespace

auto NodeConfig::builtin() noexcept -> NodeConfig {
    return NodeConfig{Layout::DEFAULT_CENTER_ID, Layout::DEFAULT_WORKER_ID};
}

auto NodeConfig::dynamic() -> NodeConfig {
    const u64 centerId = system::deriveCenterId(Layout::MAX_CENTER_ID);
    const u64 workerId = system::deriveWorkerId(centerId, Layout::MAX_WORKER_ID);
    spdlog::debug("Derived dynamic node ids: center_id={}, worker_id={}",
                  centerId, workerId);
    return NodeConfig{centerId, workerId};
}

auto NodeConfig::fromEnvironment() -> NodeConfig {
    const auto mode = readEnv(ENV_NODE_MODE).value_or("static");

    NodeConfig config = builtin();
    if (mode == "dynamic") {
        config = dynamic();
    } else if (mode == "static") {
        if (auto center = readEnv(ENV_CENTER_ID)) {
            config.center_id = parseNodeId(ENV_CENTER_ID, *center);
        }
        if (auto worker = readEnv(ENV_WORKER_ID)) {
            config.worker_id = parseNodeId(ENV_WORKER_ID, *worker);
        }
    } else {
        spdlog::error("Unknown {} value '{}'", ENV_NODE_MODE, mode);
        throw ConfigException(std::string(ENV_NODE_MODE) +
                              " must be 'static' or 'dynamic', got '" + mode +
                              "'");
    }

    spdlog::info("Resolved {} node config: {}", mode, config.toString());
    return config;
}

auto NodeConfig::toString() const -> std::string {
    return "center_id=" + std::to_string(center_id) +
           ", worker_id=" + std::to_string(worker_id);
}

auto parseNodeId(const std::string &name, const std::string &value) -> u64 {
    u64 result = 0;
    const auto *begin = value.data();
    const auto *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (value.empty() || ec != std::errc() || ptr != end) {
        spdlog::error("Invalid value '{}' for {}", value, name);
        throw ConfigException("Invalid value '" + value + "' for " + name +
                              ": expected a non-negative decimal integer");
    }
    return result;
}

}  // namespace flake::id
