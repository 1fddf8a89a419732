#include <gtest/gtest.h>
#include "upq/events/event_bus.hpp"
#include "upq/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace upq::events;

namespace {

// Second event type to check type-indexed dispatch
struct ShutdownNotice {
    std::string reason;
};

UploadQueueEvent started(const std::string& item_id) {
    return UploadQueueEvent{QueueEventType::UploadStarted, "session-1", item_id, {{"attempt", 1}}};
}

} // namespace

TEST(EventBus, DeliversUploadEvents) {
    EventBus bus;

    std::string received_item;
    QueueEventType received_type = QueueEventType::FileAdded;
    bus.subscribe<UploadQueueEvent>([&](const UploadQueueEvent& e) {
        received_item = e.item_id;
        received_type = e.type;
    });

    bus.emit(started("upload-7"));

    EXPECT_EQ(received_item, "upload-7");
    EXPECT_EQ(received_type, QueueEventType::UploadStarted);
}

TEST(EventBus, DispatchesByEventType) {
    EventBus bus;

    int upload_events = 0;
    int notices = 0;
    bus.subscribe<UploadQueueEvent>([&](const UploadQueueEvent&) { upload_events++; });
    bus.subscribe<ShutdownNotice>([&](const ShutdownNotice&) { notices++; });

    bus.emit(started("a"));
    bus.emit(ShutdownNotice{"test"});
    bus.emit(started("b"));

    EXPECT_EQ(upload_events, 2);
    EXPECT_EQ(notices, 1);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadQueueEvent>([&](const UploadQueueEvent&) { count++; });

    bus.emit(started("a"));
    bus.unsubscribe<UploadQueueEvent>(id);
    bus.emit(started("b"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadQueueEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<UploadQueueEvent>([](const UploadQueueEvent&) { throw std::runtime_error("observer bug"); });
    bus.subscribe<UploadQueueEvent>([&](const UploadQueueEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(started("a")));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<UploadQueueEvent>([&](const UploadQueueEvent&) {
        bus.subscribe<ShutdownNotice>([&](const ShutdownNotice&) { late_calls++; });
    });

    bus.emit(started("a"));
    bus.emit(ShutdownNotice{"done"});

    EXPECT_EQ(late_calls, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(started("a")));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};
    bus.subscribe<UploadQueueEvent>([&count](const UploadQueueEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus, i]() { bus.emit(started("upload-" + std::to_string(i))); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 50);
}

TEST(EventBus, Clear) {
    EventBus bus;
    bus.subscribe<UploadQueueEvent>([](const UploadQueueEvent&) {});
    bus.subscribe<ShutdownNotice>([](const ShutdownNotice&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadQueueEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ShutdownNotice>(), 0u);
}

TEST(QueueEventType, WireNames) {
    EXPECT_EQ(to_string(QueueEventType::FileAdded), "file-added");
    EXPECT_EQ(to_string(QueueEventType::UploadStarted), "upload-started");
    EXPECT_EQ(to_string(QueueEventType::ProgressUpdated), "progress-updated");
    EXPECT_EQ(to_string(QueueEventType::Paused), "paused");
    EXPECT_EQ(to_string(QueueEventType::Resumed), "resumed");
    EXPECT_EQ(to_string(QueueEventType::Cancelled), "cancelled");
    EXPECT_EQ(to_string(QueueEventType::Completed), "completed");
    EXPECT_EQ(to_string(QueueEventType::Failed), "failed");
}
