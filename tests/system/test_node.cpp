#include <gtest/gtest.h>

#include <string>

#include <spdlog/spdlog.h>

#include "flake/id/hashcode.hpp"
#include "flake/id/layout.hpp"
#include "flake/system/node.hpp"

using namespace flake::system;
using flake::id::hashCode;
using flake::id::Layout;

class NodeTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(NodeTest, HashBase) { EXPECT_EQ(flake::id::HASH_BASE, 31u); }

TEST_F(NodeTest, HashCodeIsBase31Polynomial) {
    EXPECT_EQ(hashCode(""), 0u);
    EXPECT_EQ(hashCode("a"), 97u);
    EXPECT_EQ(hashCode("ab"), 97u * 31u + 98u);
    EXPECT_EQ(hashCode("hello"), 99162322u);
    EXPECT_EQ(hashCode("11234"), 46761971u);
}

TEST_F(NodeTest, HashCodeWrapsWithoutError) {
    const std::string longText(200, 'z');
    EXPECT_EQ(hashCode(longText), hashCode(longText));
    EXPECT_NE(hashCode(longText), hashCode(longText + "z"));
}

TEST_F(NodeTest, CenterIdFromHardwareAddressUsesLastTwoBytes) {
    const HardwareAddress mac{0xAA, 0xBB, 0xCC, 0xDD, 0x12, 0x34};
    // (0x12 | 0x3400) >> 6 = 208, 208 % 32 = 16
    EXPECT_EQ(centerIdFromHardwareAddress(mac, Layout::MAX_CENTER_ID), 16u);

    const HardwareAddress zero{};
    EXPECT_EQ(centerIdFromHardwareAddress(zero, Layout::MAX_CENTER_ID), 0u);

    const HardwareAddress ones{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_LE(centerIdFromHardwareAddress(ones, Layout::MAX_CENTER_ID),
              Layout::MAX_CENTER_ID);
}

TEST_F(NodeTest, WorkerIdFromProcessHashesCenterAndPid) {
    EXPECT_EQ(workerIdFromProcess(1, 1234, Layout::MAX_WORKER_ID), 19u);
    for (flake::id::u64 pid = 1; pid < 2000; pid += 37) {
        EXPECT_LE(workerIdFromProcess(5, pid, Layout::MAX_WORKER_ID),
                  Layout::MAX_WORKER_ID);
    }
}

TEST_F(NodeTest, DerivedIdsAreInRange) {
    const auto center = deriveCenterId(Layout::MAX_CENTER_ID);
    EXPECT_LE(center, Layout::MAX_CENTER_ID);
    EXPECT_LE(deriveWorkerId(center, Layout::MAX_WORKER_ID),
              Layout::MAX_WORKER_ID);
}

TEST_F(NodeTest, DeriveCenterIdMatchesHardwareAddress) {
    const auto mac = getHardwareAddress();
    const auto center = deriveCenterId(Layout::MAX_CENTER_ID);
    if (mac) {
        EXPECT_EQ(center,
                  centerIdFromHardwareAddress(*mac, Layout::MAX_CENTER_ID));
    } else {
        EXPECT_EQ(center, Layout::DEFAULT_CENTER_ID);
    }
}

TEST_F(NodeTest, DeriveWorkerIdUsesCurrentProcess) {
    EXPECT_EQ(deriveWorkerId(3, Layout::MAX_WORKER_ID),
              workerIdFromProcess(3, currentProcessId(),
                                  Layout::MAX_WORKER_ID));
    EXPECT_GT(currentProcessId(), 0u);
}
