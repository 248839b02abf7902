/**
 * @file test_resource_limiter.cpp
 * @brief Unit tests for ResourceLimiter.
 */

#include "cloudprovider/resource_limiter.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace cluster_scaler;

TEST(ResourceLimiterTest, MinMaxLookup) {
    ResourceLimiter limiter({{"cpu", 2}, {"memory", 1024}}, {{"cpu", 64}});
    EXPECT_EQ(limiter.min("cpu"), 2);
    EXPECT_EQ(limiter.max("cpu"), 64);
    EXPECT_EQ(limiter.min("memory"), 1024);
}

TEST(ResourceLimiterTest, UnsetBoundsAreOpen) {
    ResourceLimiter limiter({}, {});
    EXPECT_EQ(limiter.min("nvidia.com/gpu"), 0);
    EXPECT_EQ(limiter.max("nvidia.com/gpu"), std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(limiter.has_limit("nvidia.com/gpu"));
}

TEST(ResourceLimiterTest, ResourcesAreSortedAndUnique) {
    ResourceLimiter limiter({{"memory", 0}, {"cpu", 0}}, {{"cpu", 8}, {"nodes", 3}});
    auto names = limiter.resources();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "cpu");
    EXPECT_EQ(names[1], "memory");
    EXPECT_EQ(names[2], "nodes");
}

TEST(ResourceLimiterTest, FromConfigConvertsMemoryToBytes) {
    LimitsConfig limits;
    limits.cores_min = 1;
    limits.cores_max = 16;
    limits.memory_min_mb = 2;
    limits.memory_max_mb = 4;
    limits.nodes_max = 7;

    auto limiter = ResourceLimiter::from_config(limits);
    ASSERT_NE(limiter, nullptr);
    EXPECT_EQ(limiter->min(kResourceCores), 1);
    EXPECT_EQ(limiter->max(kResourceCores), 16);
    EXPECT_EQ(limiter->min(kResourceMemory), 2 * 1024 * 1024);
    EXPECT_EQ(limiter->max(kResourceMemory), 4 * 1024 * 1024);
    EXPECT_EQ(limiter->max(kResourceNodes), 7);
}

TEST(ResourceLimiterTest, ToStringListsEveryResource) {
    ResourceLimiter limiter({{"cpu", 1}}, {{"cpu", 4}});
    EXPECT_EQ(limiter.to_string(), "{cpu : 1 - 4}");
}
