#pragma once

#include "upq/queue/types.hpp"

#include <vector>

namespace upq::queue {

/**
 * @brief Recompute queue statistics from the current items
 *
 * - overall_progress = uploaded / size * 100, 0 for an empty total
 * - average_speed is the mean speed of active (uploading/processing) items
 * - estimated_time_remaining = remaining bytes / average_speed, 0 when idle
 * - success_rate = completed / total, error_rate = failed / total, 0 when empty
 */
QueueStatistics compute_statistics(const std::vector<QueueItem>& items);

} // namespace upq::queue
