#include "upq/queue/statistics.hpp"

#include <gtest/gtest.h>

using upq::queue::ItemStatus;
using upq::queue::QueueItem;
using upq::queue::compute_statistics;

namespace {

QueueItem item(ItemStatus status, std::uint64_t total, std::uint64_t uploaded, double speed = 0.0) {
    QueueItem item;
    item.status = status;
    item.total_bytes = total;
    item.uploaded_bytes = uploaded;
    item.speed = speed;
    return item;
}

} // namespace

TEST(StatisticsTest, EmptyQueueIsAllZero) {
    const auto stats = compute_statistics({});
    EXPECT_EQ(stats.total_items, 0u);
    EXPECT_DOUBLE_EQ(stats.overall_progress, 0.0);
    EXPECT_DOUBLE_EQ(stats.average_speed, 0.0);
    EXPECT_EQ(stats.estimated_time_remaining.count(), 0);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.error_rate, 0.0);
}

TEST(StatisticsTest, ZeroByteItemsKeepProgressAtZero) {
    const auto stats = compute_statistics({item(ItemStatus::Queued, 0, 0)});
    EXPECT_EQ(stats.total_size, 0u);
    EXPECT_DOUBLE_EQ(stats.overall_progress, 0.0);
}

TEST(StatisticsTest, CountsEveryStatusOnce) {
    const std::vector<QueueItem> items = {
        item(ItemStatus::Queued, 100, 0),
        item(ItemStatus::Uploading, 100, 50, 200.0),
        item(ItemStatus::Processing, 100, 100, 240.0),
        item(ItemStatus::Paused, 100, 10),
        item(ItemStatus::Completed, 100, 100),
        item(ItemStatus::Failed, 100, 0),
        item(ItemStatus::Cancelled, 100, 0),
    };
    const auto stats = compute_statistics(items);

    EXPECT_EQ(stats.total_items, 7u);
    EXPECT_EQ(stats.queued_items + stats.uploading_items + stats.processing_items + stats.paused_items +
                  stats.completed_items + stats.failed_items + stats.cancelled_items,
              stats.total_items);
    EXPECT_EQ(stats.uploading_items, 1u);
    EXPECT_EQ(stats.processing_items, 1u);
    EXPECT_EQ(stats.total_size, 700u);
    EXPECT_EQ(stats.total_uploaded, 260u);
    EXPECT_NEAR(stats.overall_progress, 260.0 / 700.0 * 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(stats.average_speed, 220.0);
    EXPECT_EQ(stats.estimated_time_remaining.count(), 2000);
    EXPECT_NEAR(stats.success_rate, 1.0 / 7.0, 1e-9);
    EXPECT_NEAR(stats.error_rate, 1.0 / 7.0, 1e-9);
}

TEST(StatisticsTest, NoActiveSpeedMeansNoEstimate) {
    const auto stats = compute_statistics({item(ItemStatus::Queued, 100, 0), item(ItemStatus::Paused, 100, 40)});
    EXPECT_DOUBLE_EQ(stats.average_speed, 0.0);
    EXPECT_EQ(stats.estimated_time_remaining.count(), 0);
}

TEST(StatisticsTest, RatesStayInUnitRange) {
    const auto stats = compute_statistics({item(ItemStatus::Completed, 10, 10), item(ItemStatus::Completed, 10, 10)});
    EXPECT_DOUBLE_EQ(stats.success_rate, 1.0);
    EXPECT_DOUBLE_EQ(stats.error_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.overall_progress, 100.0);
}
