#pragma once

#include "upq/core/result.hpp"
#include "upq/queue/types.hpp"

namespace upq::queue {

[[nodiscard]] bool can_transition(ItemStatus current, ItemStatus target) noexcept;

// Completed and Cancelled; nothing leaves these states
[[nodiscard]] bool is_terminal(ItemStatus status) noexcept;

// Uploading and Processing; these items occupy a concurrency slot
[[nodiscard]] bool is_active(ItemStatus status) noexcept;

/**
 * @brief Move an item to `next`, stamping the timestamps tied to the edge
 *
 * - → Uploading stamps started_at on the first dispatch only
 * - → Paused stamps paused_at, → Queued clears it
 * - → Completed stamps completed_at and sets progress 100 / all bytes uploaded
 *
 * Illegal edges leave the item untouched and return an error.
 */
upq::Result<void> transition(QueueItem& item, ItemStatus next, Clock::time_point now = Clock::now());

} // namespace upq::queue
