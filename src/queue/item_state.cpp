#include "upq/queue/item_state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace upq::queue {

bool can_transition(ItemStatus current, ItemStatus target) noexcept {
    static const std::unordered_map<ItemStatus, std::vector<ItemStatus>> transitions {
        {ItemStatus::Queued, {ItemStatus::Uploading, ItemStatus::Cancelled}},
        {ItemStatus::Uploading, {ItemStatus::Processing, ItemStatus::Completed, ItemStatus::Failed,
                                 ItemStatus::Paused, ItemStatus::Cancelled}},
        {ItemStatus::Processing, {ItemStatus::Completed, ItemStatus::Failed, ItemStatus::Cancelled}},
        {ItemStatus::Paused, {ItemStatus::Queued, ItemStatus::Cancelled}},
        {ItemStatus::Failed, {ItemStatus::Queued, ItemStatus::Cancelled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

bool is_terminal(ItemStatus status) noexcept {
    return status == ItemStatus::Completed || status == ItemStatus::Cancelled;
}

bool is_active(ItemStatus status) noexcept {
    return status == ItemStatus::Uploading || status == ItemStatus::Processing;
}

upq::Result<void> transition(QueueItem& item, ItemStatus next, Clock::time_point now) {
    if (!can_transition(item.status, next)) {
        return upq::Err<void>(std::string("Illegal transition ") + to_string(item.status) + " -> " +
                              to_string(next) + " for item " + item.id);
    }

    item.status = next;
    switch (next) {
        case ItemStatus::Uploading:
            if (!item.started_at) {
                item.started_at = now;
            }
            break;
        case ItemStatus::Paused:
            item.paused_at = now;
            item.speed = 0.0;
            item.time_remaining.reset();
            break;
        case ItemStatus::Queued:
            item.paused_at.reset();
            item.speed = 0.0;
            item.time_remaining.reset();
            break;
        case ItemStatus::Completed:
            item.completed_at = now;
            item.progress = 100.0;
            item.uploaded_bytes = item.total_bytes;
            item.speed = 0.0;
            item.time_remaining = std::chrono::milliseconds{0};
            break;
        case ItemStatus::Failed:
        case ItemStatus::Cancelled:
            item.speed = 0.0;
            item.time_remaining.reset();
            break;
        case ItemStatus::Processing:
            break;
    }
    return upq::Ok();
}

} // namespace upq::queue
