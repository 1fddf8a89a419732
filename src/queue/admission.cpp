#include "upq/queue/admission.hpp"
#include "upq/queue/item_state.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace upq::queue {

std::vector<std::string> select_for_admission(const std::vector<QueueItem>& items, const QueueConfig& config) {
    std::unordered_map<Priority, std::uint32_t> active_per_tier;
    std::uint32_t active_total = 0;
    std::vector<const QueueItem*> queued;

    for (const auto& item : items) {
        if (is_active(item.status)) {
            ++active_total;
            ++active_per_tier[item.priority];
        } else if (item.status == ItemStatus::Queued) {
            queued.push_back(&item);
        }
    }

    std::vector<std::string> selected;
    if (active_total >= config.max_concurrent_uploads || queued.empty()) {
        return selected;
    }
    std::uint32_t available = config.max_concurrent_uploads - active_total;

    std::stable_sort(queued.begin(), queued.end(), [&config](const QueueItem* a, const QueueItem* b) {
        const auto weight_a = config.level(a->priority).weight;
        const auto weight_b = config.level(b->priority).weight;
        if (weight_a != weight_b) {
            return weight_a > weight_b;
        }
        return a->sequence < b->sequence;
    });

    for (const auto* item : queued) {
        if (available == 0) {
            break;
        }
        auto& tier_active = active_per_tier[item->priority];
        if (tier_active >= config.level(item->priority).max_concurrent) {
            continue;
        }
        selected.push_back(item->id);
        ++tier_active;
        --available;
    }
    return selected;
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, std::uint32_t retry_count) noexcept {
    using Rep = std::chrono::milliseconds::rep;
    if (base.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const Rep limit = std::numeric_limits<Rep>::max();
    Rep delay = base.count();
    for (std::uint32_t i = 0; i < retry_count; ++i) {
        if (delay > limit / 2) {
            return std::chrono::milliseconds{limit};
        }
        delay *= 2;
    }
    return std::chrono::milliseconds{delay};
}

std::uint32_t attempt_budget(std::uint32_t max_retries) noexcept {
    return std::max<std::uint32_t>(1, max_retries);
}

bool should_retry(const QueueError& error, std::uint32_t failed_attempts, std::uint32_t max_retries) noexcept {
    return error.retryable && failed_attempts < attempt_budget(max_retries);
}

} // namespace upq::queue
