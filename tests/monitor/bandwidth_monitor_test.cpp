#include "upq/monitor/bandwidth_monitor.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace std::chrono_literals;
using upq::monitor::BandwidthMonitor;

TEST(BandwidthMonitorTest, EmptyMonitorReportsZero) {
    BandwidthMonitor monitor;
    const auto snapshot = monitor.snapshot();
    EXPECT_DOUBLE_EQ(snapshot.current_speed, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.average_speed, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.peak_speed, 0.0);
    EXPECT_TRUE(snapshot.samples.empty());
    EXPECT_FALSE(snapshot.throttled);
}

TEST(BandwidthMonitorTest, TracksCurrentAveragePeak) {
    BandwidthMonitor monitor;
    monitor.record(100.0);
    monitor.record(300.0);
    monitor.record(200.0, 500ms);

    const auto snapshot = monitor.snapshot();
    EXPECT_DOUBLE_EQ(snapshot.current_speed, 200.0);
    EXPECT_DOUBLE_EQ(snapshot.average_speed, 200.0);
    EXPECT_DOUBLE_EQ(snapshot.peak_speed, 300.0);
    ASSERT_EQ(snapshot.samples.size(), 3u);
    EXPECT_DOUBLE_EQ(snapshot.samples[2].bytes_transferred, 100.0);
}

TEST(BandwidthMonitorTest, WindowDropsOldestSamples) {
    BandwidthMonitor monitor(3);
    for (double speed : {10.0, 20.0, 30.0, 40.0, 50.0}) {
        monitor.record(speed);
    }
    const auto snapshot = monitor.snapshot();
    ASSERT_EQ(snapshot.samples.size(), 3u);
    EXPECT_DOUBLE_EQ(snapshot.samples.front().speed, 30.0);
    EXPECT_DOUBLE_EQ(snapshot.average_speed, 40.0);
    // Peak survives eviction
    EXPECT_DOUBLE_EQ(snapshot.peak_speed, 50.0);
}

TEST(BandwidthMonitorTest, NegativeSpeedClampsToZero) {
    BandwidthMonitor monitor;
    monitor.record(-5.0);
    EXPECT_DOUBLE_EQ(monitor.current_speed(), 0.0);
}

TEST(BandwidthMonitorTest, ThrottledOnlyWhenEnabledAndOverLimit) {
    BandwidthMonitor disabled(60, false, 100);
    disabled.record(500.0);
    EXPECT_FALSE(disabled.throttled());

    BandwidthMonitor enabled(60, true, 100);
    enabled.record(50.0);
    EXPECT_FALSE(enabled.throttled());
    enabled.record(150.0);
    EXPECT_TRUE(enabled.throttled());
    EXPECT_TRUE(enabled.snapshot().throttled);

    BandwidthMonitor no_limit(60, true, std::nullopt);
    no_limit.record(1e9);
    EXPECT_FALSE(no_limit.throttled());
}

TEST(BandwidthMonitorTest, ResetClearsEverything) {
    BandwidthMonitor monitor;
    monitor.record(42.0);
    monitor.reset();
    const auto snapshot = monitor.snapshot();
    EXPECT_TRUE(snapshot.samples.empty());
    EXPECT_DOUBLE_EQ(snapshot.peak_speed, 0.0);
}

TEST(BandwidthMonitorTest, ConcurrentRecording) {
    BandwidthMonitor monitor(1000);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&monitor] {
            for (int i = 0; i < 100; ++i) {
                monitor.record(1.0);
                (void)monitor.snapshot();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(monitor.snapshot().samples.size(), 400u);
}
