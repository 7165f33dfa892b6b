#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "flake/id/config.hpp"
#include "flake/id/exception.hpp"
#include "flake/id/layout.hpp"
#include "flake/id/snowflake.hpp"

using namespace flake::id;

class NodeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        clearEnv();
    }

    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv(ENV_NODE_MODE);
        unsetenv(ENV_CENTER_ID);
        unsetenv(ENV_WORKER_ID);
    }

    static void setEnv(const char *name, const std::string &value) {
        setenv(name, value.c_str(), 1);
    }
};

TEST_F(NodeConfigTest, BuiltinUsesDefaults) {
    const auto config = NodeConfig::builtin();
    EXPECT_EQ(config.center_id, Layout::DEFAULT_CENTER_ID);
    EXPECT_EQ(config.worker_id, Layout::DEFAULT_WORKER_ID);
    EXPECT_EQ(config, (NodeConfig{1, 1}));
}

TEST_F(NodeConfigTest, DynamicIdsAreInRange) {
    const auto config = NodeConfig::dynamic();
    EXPECT_LE(config.center_id, Layout::MAX_CENTER_ID);
    EXPECT_LE(config.worker_id, Layout::MAX_WORKER_ID);
    EXPECT_NO_THROW({ Snowflake snowflake(config); });
}

TEST_F(NodeConfigTest, DynamicIsStableWithinProcess) {
    EXPECT_EQ(NodeConfig::dynamic(), NodeConfig::dynamic());
}

TEST_F(NodeConfigTest, EmptyEnvironmentFallsBackToBuiltin) {
    EXPECT_EQ(NodeConfig::fromEnvironment(), NodeConfig::builtin());
}

TEST_F(NodeConfigTest, StaticModeReadsIds) {
    setEnv(ENV_CENTER_ID, "12");
    setEnv(ENV_WORKER_ID, "30");
    EXPECT_EQ(NodeConfig::fromEnvironment(), (NodeConfig{12, 30}));

    setEnv(ENV_NODE_MODE, "static");
    EXPECT_EQ(NodeConfig::fromEnvironment(), (NodeConfig{12, 30}));
}

TEST_F(NodeConfigTest, PartialStaticConfigKeepsDefaultForMissingId) {
    setEnv(ENV_WORKER_ID, "9");
    EXPECT_EQ(NodeConfig::fromEnvironment(),
              (NodeConfig{Layout::DEFAULT_CENTER_ID, 9}));
}

TEST_F(NodeConfigTest, DynamicModeIgnoresStaticIds) {
    setEnv(ENV_NODE_MODE, "dynamic");
    setEnv(ENV_CENTER_ID, "not-a-number");
    EXPECT_EQ(NodeConfig::fromEnvironment(), NodeConfig::dynamic());
}

TEST_F(NodeConfigTest, UnknownModeIsRejected) {
    setEnv(ENV_NODE_MODE, "magic");
    try {
        (void)NodeConfig::fromEnvironment();
        FAIL() << "expected ConfigException";
    } catch (const ConfigException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigInvalid);
        EXPECT_THAT(e.what(), ::testing::HasSubstr("magic"));
    }
}

TEST_F(NodeConfigTest, MalformedIdsAreRejected) {
    for (const std::string bad : {"", "abc", "-1", "12x", " 3", "1.5",
                                  "99999999999999999999999"}) {
        setEnv(ENV_CENTER_ID, bad);
        EXPECT_THROW((void)NodeConfig::fromEnvironment(), ConfigException)
            << "value: '" << bad << "'";
    }
}

TEST_F(NodeConfigTest, OutOfRangeIdsFailAtConstruction) {
    setEnv(ENV_CENTER_ID, "40");
    const auto config = NodeConfig::fromEnvironment();
    EXPECT_EQ(config.center_id, 40u);
    EXPECT_THROW({ Snowflake snowflake(config); }, InvalidCenterIdException);

    setEnv(ENV_CENTER_ID, "1");
    setEnv(ENV_WORKER_ID, "32");
    EXPECT_THROW({ Snowflake snowflake(NodeConfig::fromEnvironment()); },
                 InvalidWorkerIdException);
}

TEST_F(NodeConfigTest, ParseNodeId) {
    EXPECT_EQ(parseNodeId("x", "0"), 0u);
    EXPECT_EQ(parseNodeId("x", "31"), 31u);
    EXPECT_EQ(parseNodeId("x", "007"), 7u);
    EXPECT_THROW((void)parseNodeId("x", "+1"), ConfigException);
}

TEST_F(NodeConfigTest, ToStringNamesBothIds) {
    EXPECT_EQ((NodeConfig{3, 17}).toString(), "center_id=3, worker_id=17");
}
