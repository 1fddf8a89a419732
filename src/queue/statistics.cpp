#include "upq/queue/statistics.hpp"
#include "upq/queue/item_state.hpp"

namespace upq::queue {

QueueStatistics compute_statistics(const std::vector<QueueItem>& items) {
    QueueStatistics stats;
    stats.total_items = items.size();

    double active_speed_sum = 0.0;
    std::size_t active_count = 0;

    for (const auto& item : items) {
        switch (item.status) {
            case ItemStatus::Queued: ++stats.queued_items; break;
            case ItemStatus::Uploading: ++stats.uploading_items; break;
            case ItemStatus::Processing: ++stats.processing_items; break;
            case ItemStatus::Paused: ++stats.paused_items; break;
            case ItemStatus::Completed: ++stats.completed_items; break;
            case ItemStatus::Failed: ++stats.failed_items; break;
            case ItemStatus::Cancelled: ++stats.cancelled_items; break;
        }
        stats.total_size += item.total_bytes;
        stats.total_uploaded += item.uploaded_bytes;

        if (is_active(item.status)) {
            active_speed_sum += item.speed;
            ++active_count;
        }
    }

    if (stats.total_size > 0) {
        stats.overall_progress =
            static_cast<double>(stats.total_uploaded) / static_cast<double>(stats.total_size) * 100.0;
    }
    if (active_count > 0) {
        stats.average_speed = active_speed_sum / static_cast<double>(active_count);
    }
    if (stats.average_speed > 0.0 && stats.total_size > stats.total_uploaded) {
        const auto remaining = static_cast<double>(stats.total_size - stats.total_uploaded);
        stats.estimated_time_remaining =
            std::chrono::milliseconds{static_cast<std::int64_t>(remaining / stats.average_speed * 1000.0)};
    }
    if (stats.total_items > 0) {
        const auto total = static_cast<double>(stats.total_items);
        stats.success_rate = static_cast<double>(stats.completed_items) / total;
        stats.error_rate = static_cast<double>(stats.failed_items) / total;
    }
    return stats;
}

} // namespace upq::queue
