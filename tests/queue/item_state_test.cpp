#include "upq/queue/item_state.hpp"

#include <gtest/gtest.h>

using upq::queue::Clock;
using upq::queue::ItemStatus;
using upq::queue::QueueItem;
using upq::queue::can_transition;
using upq::queue::is_active;
using upq::queue::is_terminal;
using upq::queue::transition;

namespace {

QueueItem item_in(ItemStatus status) {
    QueueItem item;
    item.id = "upload-1";
    item.total_bytes = 1000;
    item.uploaded_bytes = 400;
    item.progress = 40.0;
    item.speed = 100.0;
    item.status = status;
    return item;
}

} // namespace

TEST(ItemStateTest, PauseOnlyFromUploading) {
    EXPECT_TRUE(can_transition(ItemStatus::Uploading, ItemStatus::Paused));
    for (auto from : {ItemStatus::Queued, ItemStatus::Processing, ItemStatus::Paused,
                      ItemStatus::Completed, ItemStatus::Failed, ItemStatus::Cancelled}) {
        EXPECT_FALSE(can_transition(from, ItemStatus::Paused)) << to_string(from);
    }
}

TEST(ItemStateTest, ResumeOnlyFromPaused) {
    EXPECT_TRUE(can_transition(ItemStatus::Paused, ItemStatus::Queued));
    EXPECT_FALSE(can_transition(ItemStatus::Uploading, ItemStatus::Queued));
    EXPECT_FALSE(can_transition(ItemStatus::Completed, ItemStatus::Queued));
}

TEST(ItemStateTest, CancelFromEveryNonTerminalState) {
    for (auto from : {ItemStatus::Queued, ItemStatus::Uploading, ItemStatus::Processing,
                      ItemStatus::Paused, ItemStatus::Failed}) {
        EXPECT_TRUE(can_transition(from, ItemStatus::Cancelled)) << to_string(from);
    }
    EXPECT_FALSE(can_transition(ItemStatus::Completed, ItemStatus::Cancelled));
    EXPECT_FALSE(can_transition(ItemStatus::Cancelled, ItemStatus::Cancelled));
}

TEST(ItemStateTest, TerminalAndActiveSets) {
    EXPECT_TRUE(is_terminal(ItemStatus::Completed));
    EXPECT_TRUE(is_terminal(ItemStatus::Cancelled));
    EXPECT_FALSE(is_terminal(ItemStatus::Failed));
    EXPECT_TRUE(is_active(ItemStatus::Uploading));
    EXPECT_TRUE(is_active(ItemStatus::Processing));
    EXPECT_FALSE(is_active(ItemStatus::Paused));
}

TEST(ItemStateTest, CompletionFillsProgress) {
    auto item = item_in(ItemStatus::Processing);
    const auto now = Clock::now();

    ASSERT_TRUE(transition(item, ItemStatus::Completed, now).is_ok());
    EXPECT_EQ(item.status, ItemStatus::Completed);
    EXPECT_DOUBLE_EQ(item.progress, 100.0);
    EXPECT_EQ(item.uploaded_bytes, item.total_bytes);
    EXPECT_EQ(item.completed_at, now);
    EXPECT_DOUBLE_EQ(item.speed, 0.0);
}

TEST(ItemStateTest, StartedAtIsStampedOnce) {
    auto item = item_in(ItemStatus::Queued);
    const auto first = Clock::now();
    ASSERT_TRUE(transition(item, ItemStatus::Uploading, first).is_ok());
    ASSERT_TRUE(transition(item, ItemStatus::Paused, first + std::chrono::seconds{1}).is_ok());
    ASSERT_TRUE(transition(item, ItemStatus::Queued).is_ok());
    ASSERT_TRUE(transition(item, ItemStatus::Uploading, first + std::chrono::seconds{5}).is_ok());

    EXPECT_EQ(item.started_at, first);
    EXPECT_FALSE(item.paused_at.has_value());
}

TEST(ItemStateTest, PauseStampsAndStopsSpeed) {
    auto item = item_in(ItemStatus::Uploading);
    const auto now = Clock::now();
    ASSERT_TRUE(transition(item, ItemStatus::Paused, now).is_ok());
    EXPECT_EQ(item.paused_at, now);
    EXPECT_DOUBLE_EQ(item.speed, 0.0);
    EXPECT_EQ(item.uploaded_bytes, 400u);
}

TEST(ItemStateTest, IllegalTransitionLeavesItemUntouched) {
    auto item = item_in(ItemStatus::Completed);
    auto result = transition(item, ItemStatus::Uploading);

    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("completed -> uploading"), std::string::npos);
    EXPECT_EQ(item.status, ItemStatus::Completed);
}
