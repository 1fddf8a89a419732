/**
 * @file components.hpp
 * @brief Ready-made subscribers for the upload event stream
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "upq/events/event_bus.hpp"
#include "upq/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace upq::events {

/**
 * @brief Logs every lifecycle event with spdlog
 *
 * Progress goes to debug so a busy queue does not flood info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        subscription_ = bus_.subscribe<UploadQueueEvent>([this](const UploadQueueEvent& e) { on_event(e); });
    }

    ~LoggerComponent() { bus_.unsubscribe<UploadQueueEvent>(subscription_); }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_event(const UploadQueueEvent& e) {
        switch (e.type) {
            case QueueEventType::FileAdded:
                spdlog::info("[FileAdded] session={} item={} file={} size={} priority={}",
                             e.session_id, e.item_id,
                             e.data.value("filename", std::string{}),
                             e.data.value("size", std::uint64_t{0}),
                             e.data.value("priority", std::string{}));
                break;
            case QueueEventType::UploadStarted:
                spdlog::info("[UploadStarted] session={} item={} attempt={} strategy={}",
                             e.session_id, e.item_id,
                             e.data.value("attempt", 0),
                             e.data.value("strategy", std::string{}));
                break;
            case QueueEventType::ProgressUpdated:
                spdlog::debug("[Progress] item={} progress={:.1f}% bytes={}/{} speed={:.0f}B/s",
                              e.item_id,
                              e.data.value("progress", 0.0),
                              e.data.value("uploadedBytes", std::uint64_t{0}),
                              e.data.value("totalBytes", std::uint64_t{0}),
                              e.data.value("speed", 0.0));
                break;
            case QueueEventType::Paused:
                spdlog::info("[Paused] session={} item={} reason={}",
                             e.session_id, e.item_id, e.data.value("reason", std::string{}));
                break;
            case QueueEventType::Resumed:
                spdlog::info("[Resumed] session={} item={} reason={}",
                             e.session_id, e.item_id, e.data.value("reason", std::string{}));
                break;
            case QueueEventType::Cancelled:
                spdlog::info("[Cancelled] session={} item={} previous={}",
                             e.session_id, e.item_id, e.data.value("previousStatus", std::string{}));
                break;
            case QueueEventType::Completed:
                spdlog::info("[Completed] session={} item={} bytes={} duration={}ms",
                             e.session_id, e.item_id,
                             e.data.value("totalBytes", std::uint64_t{0}),
                             e.data.value("durationMs", std::int64_t{0}));
                break;
            case QueueEventType::Failed:
                if (e.data.value("willRetry", false)) {
                    spdlog::warn("[Failed] session={} item={} retry={} in {}ms: {}",
                                 e.session_id, e.item_id,
                                 e.data.value("retryCount", 0),
                                 e.data.value("retryDelayMs", std::int64_t{0}),
                                 failure_message(e));
                } else {
                    spdlog::error("[Failed] session={} item={} retries={}: {}",
                                  e.session_id, e.item_id,
                                  e.data.value("retryCount", 0),
                                  failure_message(e));
                }
                break;
        }
    }

    static std::string failure_message(const UploadQueueEvent& e) {
        const auto it = e.data.find("error");
        if (it == e.data.end() || !it->is_object()) {
            return "unknown error";
        }
        return it->value("message", std::string{"unknown error"});
    }

    EventBus& bus_;
    std::size_t subscription_ = 0;
};

/**
 * @brief Counts lifecycle events for monitoring
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> files_added{0};
        std::atomic<std::uint64_t> uploads_started{0};
        std::atomic<std::uint64_t> progress_updates{0};
        std::atomic<std::uint64_t> paused{0};
        std::atomic<std::uint64_t> resumed{0};
        std::atomic<std::uint64_t> cancelled{0};
        std::atomic<std::uint64_t> completed{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> retries_scheduled{0};
        std::atomic<std::uint64_t> bytes_completed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        subscription_ = bus_.subscribe<UploadQueueEvent>([this](const UploadQueueEvent& e) { on_event(e); });
    }

    ~MetricsComponent() { bus_.unsubscribe<UploadQueueEvent>(subscription_); }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const { return stats_; }

private:
    void on_event(const UploadQueueEvent& e) {
        switch (e.type) {
            case QueueEventType::FileAdded: stats_.files_added++; break;
            case QueueEventType::UploadStarted: stats_.uploads_started++; break;
            case QueueEventType::ProgressUpdated: stats_.progress_updates++; break;
            case QueueEventType::Paused: stats_.paused++; break;
            case QueueEventType::Resumed: stats_.resumed++; break;
            case QueueEventType::Cancelled: stats_.cancelled++; break;
            case QueueEventType::Completed:
                stats_.completed++;
                stats_.bytes_completed += e.data.value("totalBytes", std::uint64_t{0});
                break;
            case QueueEventType::Failed:
                stats_.failed++;
                if (e.data.value("willRetry", false)) {
                    stats_.retries_scheduled++;
                }
                break;
        }
    }

    EventBus& bus_;
    std::size_t subscription_ = 0;
    Stats stats_;
};

} // namespace upq::events
