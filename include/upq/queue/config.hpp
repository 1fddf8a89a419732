#pragma once

#include "upq/core/result.hpp"
#include "upq/queue/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace upq::queue {

/**
 * @brief Scheduling weight and concurrency cap of one priority tier
 */
struct PriorityLevel {
    Priority level = Priority::Normal;
    std::uint32_t weight = 0;
    std::uint32_t max_concurrent = 0;
};

std::vector<PriorityLevel> default_priority_levels();

struct QueueConfig {
    std::uint32_t max_concurrent_uploads = 3;
    std::uint32_t max_retries = 3;                         ///< total attempts per item
    std::chrono::milliseconds retry_delay{1000};           ///< backoff base
    std::uint64_t chunk_size = 1024 * 1024;
    std::chrono::milliseconds timeout_duration{30000};     ///< max time without progress
    bool enable_bandwidth_throttling = false;
    std::optional<std::uint64_t> max_bandwidth;            ///< bytes per second
    std::vector<PriorityLevel> priority_levels = default_priority_levels();

    std::uint64_t chunked_threshold = 10 * 1024 * 1024;
    std::chrono::milliseconds admission_debounce{100};
    std::chrono::milliseconds bandwidth_sample_interval{1000};
    std::size_t bandwidth_window = 60;
    std::chrono::milliseconds resource_sample_interval{5000};

    // Tiers missing from priority_levels weigh 0 and admit nothing
    [[nodiscard]] PriorityLevel level(Priority priority) const noexcept;
};

upq::Result<void> validate_config(const QueueConfig& config);

/**
 * @brief Parse a configuration from JSON text
 *
 * Keys are camelCase (maxConcurrentUploads, retryDelay, priorityLevels, ...).
 * Missing keys keep their defaults. The parsed result is validated.
 */
upq::Result<QueueConfig> parse_queue_config(const std::string& json_text);

upq::Result<QueueConfig> load_queue_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const QueueConfig& config);

} // namespace upq::queue
