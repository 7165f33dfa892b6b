/*
 * default.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Process-wide default snowflake generators

**************************************************/

#include "default.hpp"

#include <memory>
#include <mutex>

#include <spdlog/spdlog.h>

namespace flake::id {

namespace {
struct Slot {
    std::mutex mutex;
    std::unique_ptr<Snowflake> generator;
    NodeConfig config{};
};

auto defaultSlot() -> Slot & {
    static Slot slot;
    return slot;
}

auto dynamicSlot() -> Slot & {
    static Slot slot;
    return slot;
}
}  // namespace

auto initDefaultGenerator(const NodeConfig &config) -> Snowflake & {
    auto &slot = defaultSlot();
    std::lock_guard lock(slot.mutex);
    if (slot.generator) {
        if (slot.config != config) {
            spdlog::error(
                "Default generator already initialized with {}, refusing {}",
                slot.config.toString(), config.toString());
            throw SnowflakeException(
                ErrorKind::ConfigInvalid,
                "Default generator already initialized with " +
                    slot.config.toString());
        }
        return *slot.generator;
    }
    slot.generator = std::make_unique<Snowflake>(config);
    slot.config = config;
    spdlog::info("Default generator initialized: {}", config.toString());
    return *slot.generator;
}

auto defaultGenerator() -> Snowflake & {
    auto &slot = defaultSlot();
    std::lock_guard lock(slot.mutex);
    if (!slot.generator) {
        slot.config = NodeConfig::builtin();
        slot.generator = std::make_unique<Snowflake>(slot.config);
        spdlog::info("Default generator initialized with builtin {}",
                     slot.config.toString());
    }
    return *slot.generator;
}

auto dynamicGenerator() -> Snowflake & {
    auto &slot = dynamicSlot();
    std::lock_guard lock(slot.mutex);
    if (!slot.generator) {
        slot.config = NodeConfig::dynamic();
        slot.generator = std::make_unique<Snowflake>(slot.config);
        spdlog::info("Dynamic generator initialized: {}",
                     slot.config.toString());
    }
    return *slot.generator;
}

auto nextId() -> u64 { return defaultGenerator().nextId(); }

auto nextIdString() -> std::string { return defaultGenerator().nextIdString(); }

auto dynamicNextId() -> u64 { return dynamicGenerator().nextId(); }

auto dynamicNextIdString() -> std::string {
    return dynamicGenerator().nextIdString();
}

}  // namespace flake::id
