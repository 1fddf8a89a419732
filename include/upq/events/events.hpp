/**
 * @file events.hpp
 * @brief Upload lifecycle events published by the scheduler
 *
 * Every event carries the session and item it concerns plus a JSON payload
 * whose shape depends on the type:
 * - file-added:       {filename, size, priority, strategy}
 * - upload-started:   {attempt, strategy, resumedFromBytes}
 * - progress-updated: {progress, uploadedBytes, totalBytes, speed, timeRemaining}
 * - paused/resumed:   {reason}
 * - cancelled:        {previousStatus}
 * - completed:        {totalBytes, durationMs, response}
 * - failed:           {error, retryCount, willRetry, retryDelayMs?}
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace upq::events {

enum class QueueEventType {
    FileAdded,
    UploadStarted,
    ProgressUpdated,
    Paused,
    Resumed,
    Cancelled,
    Completed,
    Failed,
};

inline constexpr std::string_view to_string(QueueEventType type) noexcept {
    switch (type) {
        case QueueEventType::FileAdded: return "file-added";
        case QueueEventType::UploadStarted: return "upload-started";
        case QueueEventType::ProgressUpdated: return "progress-updated";
        case QueueEventType::Paused: return "paused";
        case QueueEventType::Resumed: return "resumed";
        case QueueEventType::Cancelled: return "cancelled";
        case QueueEventType::Completed: return "completed";
        case QueueEventType::Failed: return "failed";
    }
    return "unknown";
}

struct UploadQueueEvent {
    QueueEventType type;
    std::string session_id;
    std::string item_id;
    nlohmann::json data = nlohmann::json::object();
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

} // namespace upq::events
