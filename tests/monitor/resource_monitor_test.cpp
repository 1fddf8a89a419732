#include "upq/monitor/resource_monitor.hpp"

#include <gtest/gtest.h>

#include <chrono>

using upq::monitor::ResourceMonitor;

TEST(ResourceMonitorTest, ReadsResidentMemory) {
    EXPECT_GT(ResourceMonitor::read_resident_memory(), 0u);
}

TEST(ResourceMonitorTest, CpuTimeIsMonotonic) {
    const auto first = ResourceMonitor::read_cpu_time();
    ASSERT_TRUE(first.has_value());

    volatile double sink = 0.0;
    for (int i = 0; i < 2000000; ++i) {
        sink = sink + i * 0.5;
    }

    const auto second = ResourceMonitor::read_cpu_time();
    ASSERT_TRUE(second.has_value());
    EXPECT_GE(*second, *first);
}

TEST(ResourceMonitorTest, FirstSampleHasNoCpuFigure) {
    ResourceMonitor monitor;
    const auto usage = monitor.sample(1234.0);
    EXPECT_DOUBLE_EQ(usage.cpu_usage, 0.0);
    EXPECT_DOUBLE_EQ(usage.network_bandwidth, 1234.0);
    EXPECT_GT(usage.memory_usage, 0u);
}

TEST(ResourceMonitorTest, LatestReturnsLastSample) {
    ResourceMonitor monitor;
    EXPECT_EQ(monitor.latest().memory_usage, 0u);

    monitor.sample(1.0);
    const auto second = monitor.sample(2.0);
    const auto latest = monitor.latest();
    EXPECT_DOUBLE_EQ(latest.network_bandwidth, 2.0);
    EXPECT_TRUE(latest.sampled_at == second.sampled_at);
    EXPECT_GE(latest.cpu_usage, 0.0);
}
