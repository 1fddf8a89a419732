#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace upq::monitor {

struct ResourceUsage {
    double cpu_usage = 0.0;             ///< percent of one core since the previous sample
    std::uint64_t memory_usage = 0;     ///< resident set size, bytes
    double network_bandwidth = 0.0;     ///< latest aggregate upload speed, bytes per second
    std::chrono::system_clock::time_point sampled_at{};
};

/**
 * @brief Best-effort process telemetry
 *
 * Reads VmRSS from /proc/self/status (falling back to getrusage max RSS) and
 * derives CPU usage from the getrusage user+system time delta between two
 * samples. Anything unreadable reports 0. Read-only: never affects scheduling.
 */
class ResourceMonitor {
public:
    ResourceMonitor() = default;

    ResourceUsage sample(double network_bandwidth);
    [[nodiscard]] ResourceUsage latest() const;

    [[nodiscard]] static std::uint64_t read_resident_memory();
    [[nodiscard]] static std::optional<std::chrono::microseconds> read_cpu_time();

private:
    mutable std::mutex mutex_;
    ResourceUsage latest_{};
    std::optional<std::chrono::microseconds> last_cpu_time_;
    std::optional<std::chrono::steady_clock::time_point> last_sample_at_;
};

} // namespace upq::monitor
