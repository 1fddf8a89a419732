#pragma once

#include "upq/queue/config.hpp"
#include "upq/queue/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace upq::queue {

/**
 * @brief Pick the queued items to start now
 *
 * HOW IT WORKS:
 * 1. available = max_concurrent_uploads - |active items|; stop if <= 0
 * 2. queued items sorted by descending tier weight, FIFO (sequence) inside a tier
 * 3. walk that order, admitting an item only while global slots remain and
 *    its tier is below its own cap; capped tiers are skipped, not waited on
 *
 * Active items (Uploading/Processing) count against both caps. Admitted items
 * are never preempted, so the result only ever adds work.
 */
std::vector<std::string> select_for_admission(const std::vector<QueueItem>& items, const QueueConfig& config);

// base * 2^retry_count, saturating instead of overflowing
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, std::uint32_t retry_count) noexcept;

// Attempts allowed for a max_retries setting; values below 1 behave as 1
std::uint32_t attempt_budget(std::uint32_t max_retries) noexcept;

/**
 * @brief Retry policy shared by items and chunks
 *
 * `failed_attempts` counts the attempt that just failed. A retry is allowed
 * while the error is retryable and the attempt budget is not spent.
 */
bool should_retry(const QueueError& error, std::uint32_t failed_attempts, std::uint32_t max_retries) noexcept;

} // namespace upq::queue
