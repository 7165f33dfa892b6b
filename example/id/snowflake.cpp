#include "flake/id/config.hpp"
#include "flake/id/default.hpp"
#include "flake/id/snowflake.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main() {
    using namespace flake::id;

    try {
        // Resolve center/worker ids from FLAKE_NODE_MODE, FLAKE_CENTER_ID
        // and FLAKE_WORKER_ID
        const NodeConfig config = NodeConfig::fromEnvironment();

        // Create a Snowflake generator for this node
        Snowflake snowflake(config);

        // Generate a unique ID
        const u64 id = snowflake.nextId();
        std::cout << "Generated ID: " << id << std::endl;

        // Parse the generated ID
        const IdParts parts = Snowflake::parseId(id);
        std::cout << "Parsed ID:" << std::endl;
        std::cout << "  Timestamp: " << parts.timestamp << std::endl;
        std::cout << "  Center ID: " << parts.center_id << std::endl;
        std::cout << "  Worker ID: " << parts.worker_id << std::endl;
        std::cout << "  Sequence: " << parts.sequence << std::endl;

        // Generate a batch
        for (u64 batchId : snowflake.nextIds<5>()) {
            std::cout << "Batch ID: " << batchId << std::endl;
        }

        // Process-wide generators
        initDefaultGenerator(config);
        std::cout << "Default generator ID: " << nextIdString() << std::endl;
        std::cout << "Dynamic generator ID: " << dynamicNextIdString()
                  << std::endl;

        const auto stats = snowflake.getStatistics();
        std::cout << "IDs generated: " << stats.total_ids_generated
                  << std::endl;
    } catch (const SnowflakeException &e) {
        spdlog::error("Snowflake error ({}): {}", toString(e.kind()), e.what());
        return 1;
    }

    return 0;
}
