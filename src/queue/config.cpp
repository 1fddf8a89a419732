#include "upq/queue/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace upq::queue {
using json = nlohmann::json;

namespace {

template<typename Ms>
Ms read_ms(const json& j, const char* key, Ms fallback) {
    return Ms{j.value(key, static_cast<std::int64_t>(fallback.count()))};
}

// Rejects negative and oversized values instead of letting them wrap
template<typename T>
T read_count(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j[key];
    if (!value.is_number_integer()) {
        throw std::out_of_range(std::string(key) + " must be a whole number");
    }
    if (!value.is_number_unsigned() && value.get<std::int64_t>() < 0) {
        throw std::out_of_range(std::string(key) + " must not be negative");
    }
    const auto count = value.get<std::uint64_t>();
    if (count > std::numeric_limits<T>::max()) {
        throw std::out_of_range(std::string(key) + " is out of range");
    }
    return static_cast<T>(count);
}

} // namespace

std::vector<PriorityLevel> default_priority_levels() {
    return {
        {Priority::Urgent, 100, 2},
        {Priority::High, 75, 2},
        {Priority::Normal, 50, 3},
        {Priority::Low, 25, 1},
    };
}

PriorityLevel QueueConfig::level(Priority priority) const noexcept {
    for (const auto& entry : priority_levels) {
        if (entry.level == priority) {
            return entry;
        }
    }
    return PriorityLevel{priority, 0, 0};
}

upq::Result<void> validate_config(const QueueConfig& config) {
    if (config.max_concurrent_uploads == 0) {
        return upq::Err<void>(std::string("maxConcurrentUploads must be > 0"));
    }
    if (config.chunk_size == 0) {
        return upq::Err<void>(std::string("chunkSize must be > 0"));
    }
    if (config.timeout_duration.count() <= 0) {
        return upq::Err<void>(std::string("timeoutDuration must be > 0"));
    }
    if (config.retry_delay.count() < 0) {
        return upq::Err<void>(std::string("retryDelay must not be negative"));
    }
    if (config.bandwidth_window == 0) {
        return upq::Err<void>(std::string("bandwidthWindow must be > 0"));
    }
    if (config.admission_debounce.count() < 0) {
        return upq::Err<void>(std::string("admissionDebounce must not be negative"));
    }
    if (config.bandwidth_sample_interval.count() <= 0 || config.resource_sample_interval.count() <= 0) {
        return upq::Err<void>(std::string("sample intervals must be > 0"));
    }
    for (auto tier : {Priority::Urgent, Priority::High, Priority::Normal, Priority::Low}) {
        const auto count = std::count_if(config.priority_levels.begin(), config.priority_levels.end(),
                                         [tier](const PriorityLevel& level) { return level.level == tier; });
        if (count != 1) {
            return upq::Err<void>(std::string("priorityLevels must define tier '") + to_string(tier) +
                                  "' exactly once");
        }
    }
    return upq::Ok();
}

upq::Result<QueueConfig> parse_queue_config(const std::string& json_text) {
    auto payload = json::parse(json_text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return upq::Err<QueueConfig>(std::string("Invalid JSON configuration"));
    }

    QueueConfig config;
    try {
        config.max_concurrent_uploads = read_count(payload, "maxConcurrentUploads", config.max_concurrent_uploads);
        config.max_retries = read_count(payload, "maxRetries", config.max_retries);
        config.retry_delay = read_ms(payload, "retryDelay", config.retry_delay);
        config.chunk_size = read_count(payload, "chunkSize", config.chunk_size);
        config.timeout_duration = read_ms(payload, "timeoutDuration", config.timeout_duration);
        config.enable_bandwidth_throttling =
            payload.value("enableBandwidthThrottling", config.enable_bandwidth_throttling);
        if (payload.contains("maxBandwidth") && !payload["maxBandwidth"].is_null()) {
            config.max_bandwidth = read_count<std::uint64_t>(payload, "maxBandwidth", 0);
        }
        config.chunked_threshold = read_count(payload, "chunkedThreshold", config.chunked_threshold);
        config.admission_debounce = read_ms(payload, "admissionDebounce", config.admission_debounce);
        config.bandwidth_sample_interval =
            read_ms(payload, "bandwidthSampleInterval", config.bandwidth_sample_interval);
        config.bandwidth_window = read_count(payload, "bandwidthWindow", config.bandwidth_window);
        config.resource_sample_interval =
            read_ms(payload, "resourceSampleInterval", config.resource_sample_interval);

        if (payload.contains("priorityLevels")) {
            const auto& levels = payload["priorityLevels"];
            if (!levels.is_array()) {
                return upq::Err<QueueConfig>(std::string("priorityLevels must be an array"));
            }
            config.priority_levels.clear();
            for (const auto& entry : levels) {
                const auto name = entry.value("level", std::string{});
                const auto priority = priority_from_string(name);
                if (!priority) {
                    return upq::Err<QueueConfig>(std::string("Unknown priority level: ") + name);
                }
                PriorityLevel level;
                level.level = *priority;
                level.weight = read_count<std::uint32_t>(entry, "weight", 0);
                level.max_concurrent = read_count<std::uint32_t>(entry, "maxConcurrent", 0);
                config.priority_levels.push_back(level);
            }
        }
    } catch (const json::exception& e) {
        return upq::Err<QueueConfig>(std::string("Invalid configuration value: ") + e.what());
    } catch (const std::out_of_range& e) {
        return upq::Err<QueueConfig>(std::string("Invalid configuration value: ") + e.what());
    }

    auto valid = validate_config(config);
    if (valid.is_error()) {
        return upq::Err<QueueConfig>(valid.error());
    }
    return upq::Ok(std::move(config));
}

upq::Result<QueueConfig> load_queue_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return upq::Err<QueueConfig>(std::string("Failed to open config file: ") + path.string());
    }
    std::ostringstream content;
    content << input.rdbuf();

    auto result = parse_queue_config(content.str());
    if (result.is_ok()) {
        spdlog::info("Loaded queue configuration from {}", path.string());
    }
    return result;
}

json config_to_json(const QueueConfig& config) {
    json j;
    j["maxConcurrentUploads"] = config.max_concurrent_uploads;
    j["maxRetries"] = config.max_retries;
    j["retryDelay"] = config.retry_delay.count();
    j["chunkSize"] = config.chunk_size;
    j["timeoutDuration"] = config.timeout_duration.count();
    j["enableBandwidthThrottling"] = config.enable_bandwidth_throttling;
    j["maxBandwidth"] = config.max_bandwidth ? json(*config.max_bandwidth) : json(nullptr);
    j["chunkedThreshold"] = config.chunked_threshold;
    j["admissionDebounce"] = config.admission_debounce.count();
    j["bandwidthSampleInterval"] = config.bandwidth_sample_interval.count();
    j["bandwidthWindow"] = config.bandwidth_window;
    j["resourceSampleInterval"] = config.resource_sample_interval.count();

    j["priorityLevels"] = json::array();
    for (const auto& level : config.priority_levels) {
        j["priorityLevels"].push_back({
            {"level", to_string(level.level)},
            {"weight", level.weight},
            {"maxConcurrent", level.max_concurrent},
        });
    }
    return j;
}

} // namespace upq::queue
