#include "upq/queue/admission.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;
using upq::queue::ErrorType;
using upq::queue::ItemStatus;
using upq::queue::Priority;
using upq::queue::PriorityLevel;
using upq::queue::QueueConfig;
using upq::queue::QueueError;
using upq::queue::QueueItem;
using upq::queue::attempt_budget;
using upq::queue::backoff_delay;
using upq::queue::select_for_admission;
using upq::queue::should_retry;

namespace {

QueueItem make_item(const std::string& id, Priority priority, std::uint64_t sequence,
                    ItemStatus status = ItemStatus::Queued) {
    QueueItem item;
    item.id = id;
    item.priority = priority;
    item.sequence = sequence;
    item.status = status;
    return item;
}

QueueConfig scenario_config() {
    QueueConfig config;
    config.max_concurrent_uploads = 2;
    config.priority_levels = {
        PriorityLevel{Priority::Urgent, 100, 1},
        PriorityLevel{Priority::High, 75, 2},
        PriorityLevel{Priority::Normal, 50, 2},
        PriorityLevel{Priority::Low, 25, 2},
    };
    return config;
}

QueueError error_of(bool retryable) {
    QueueError error;
    error.type = retryable ? ErrorType::Network : ErrorType::Client;
    error.retryable = retryable;
    return error;
}

} // namespace

TEST(AdmissionTest, UrgentAndOneNormalStartFirst) {
    const std::vector<QueueItem> items = {
        make_item("urgent", Priority::Urgent, 1),
        make_item("normal-1", Priority::Normal, 2),
        make_item("normal-2", Priority::Normal, 3),
        make_item("low-1", Priority::Low, 4),
        make_item("low-2", Priority::Low, 5),
    };

    const auto selected = select_for_admission(items, scenario_config());
    EXPECT_EQ(selected, (std::vector<std::string>{"urgent", "normal-1"}));
}

TEST(AdmissionTest, LowPriorityWaitsForAFreeSlot) {
    std::vector<QueueItem> items = {
        make_item("urgent", Priority::Urgent, 1, ItemStatus::Uploading),
        make_item("normal-1", Priority::Normal, 2, ItemStatus::Uploading),
        make_item("low-1", Priority::Low, 4),
    };
    EXPECT_TRUE(select_for_admission(items, scenario_config()).empty());

    items[0].status = ItemStatus::Completed;
    EXPECT_EQ(select_for_admission(items, scenario_config()), (std::vector<std::string>{"low-1"}));
}

TEST(AdmissionTest, FifoWithinTier) {
    const std::vector<QueueItem> items = {
        make_item("late", Priority::High, 9),
        make_item("early", Priority::High, 3),
    };
    auto config = scenario_config();
    config.max_concurrent_uploads = 1;

    EXPECT_EQ(select_for_admission(items, config), (std::vector<std::string>{"early"}));
}

TEST(AdmissionTest, CappedTierIsSkippedNotWaitedOn) {
    const std::vector<QueueItem> items = {
        make_item("urgent-active", Priority::Urgent, 1, ItemStatus::Uploading),
        make_item("urgent-queued", Priority::Urgent, 2),
        make_item("low", Priority::Low, 3),
    };

    EXPECT_EQ(select_for_admission(items, scenario_config()), (std::vector<std::string>{"low"}));
}

TEST(AdmissionTest, ProcessingItemsHoldTheirSlot) {
    const std::vector<QueueItem> items = {
        make_item("a", Priority::Normal, 1, ItemStatus::Processing),
        make_item("b", Priority::Normal, 2, ItemStatus::Uploading),
        make_item("c", Priority::Normal, 3),
    };
    EXPECT_TRUE(select_for_admission(items, scenario_config()).empty());
}

TEST(AdmissionTest, IgnoresNonQueuedItems) {
    const std::vector<QueueItem> items = {
        make_item("paused", Priority::Urgent, 1, ItemStatus::Paused),
        make_item("failed", Priority::Urgent, 2, ItemStatus::Failed),
        make_item("done", Priority::Urgent, 3, ItemStatus::Completed),
    };
    EXPECT_TRUE(select_for_admission(items, scenario_config()).empty());
}

TEST(AdmissionTest, NeverExceedsCapsForManyItems) {
    std::vector<QueueItem> items;
    const Priority tiers[] = {Priority::Urgent, Priority::High, Priority::Normal, Priority::Low};
    for (std::uint64_t i = 0; i < 40; ++i) {
        items.push_back(make_item("item-" + std::to_string(i), tiers[i % 4], i));
    }
    QueueConfig config;  // defaults: 3 slots, urgent cap 2
    const auto selected = select_for_admission(items, config);

    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0], "item-0");   // urgent
    EXPECT_EQ(selected[1], "item-4");   // urgent, cap now reached
    EXPECT_EQ(selected[2], "item-1");   // high
}

TEST(BackoffTest, DoublesPerRetry) {
    EXPECT_EQ(backoff_delay(1000ms, 0), 1000ms);
    EXPECT_EQ(backoff_delay(1000ms, 1), 2000ms);
    EXPECT_EQ(backoff_delay(1000ms, 2), 4000ms);
    EXPECT_EQ(backoff_delay(0ms, 5), 0ms);
}

TEST(BackoffTest, SaturatesInsteadOfOverflowing) {
    const auto huge = backoff_delay(1000ms, 200);
    EXPECT_GT(huge, backoff_delay(1000ms, 30));
    EXPECT_GT(huge.count(), 0);
}

TEST(RetryPolicyTest, ThreeAttemptsWithMaxRetriesThree) {
    const auto retryable = error_of(true);
    EXPECT_TRUE(should_retry(retryable, 1, 3));
    EXPECT_TRUE(should_retry(retryable, 2, 3));
    EXPECT_FALSE(should_retry(retryable, 3, 3));
}

TEST(RetryPolicyTest, NonRetryableFailsImmediately) {
    EXPECT_FALSE(should_retry(error_of(false), 1, 3));
}

TEST(RetryPolicyTest, BudgetNeverBelowOneAttempt) {
    EXPECT_EQ(attempt_budget(0), 1u);
    EXPECT_EQ(attempt_budget(5), 5u);
    EXPECT_FALSE(should_retry(error_of(true), 1, 0));
}
