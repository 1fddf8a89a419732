#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace upq::monitor {

struct SpeedSample {
    std::chrono::system_clock::time_point timestamp{};
    double bytes_transferred = 0.0;  ///< bytes moved during the sample interval
    double speed = 0.0;              ///< bytes per second
};

struct BandwidthSnapshot {
    double current_speed = 0.0;
    double average_speed = 0.0;
    double peak_speed = 0.0;
    std::vector<SpeedSample> samples;
    bool throttled = false;
};

/**
 * @brief Rolling window of aggregate upload speed samples
 *
 * The scheduler feeds one sample per interval from its own timer. The monitor
 * only observes; it never touches queue items.
 *
 * THREAD SAFETY: all members may be called concurrently.
 */
class BandwidthMonitor {
public:
    explicit BandwidthMonitor(std::size_t window = 60,
                              bool throttling_enabled = false,
                              std::optional<std::uint64_t> max_bandwidth = std::nullopt);

    void record(double speed,
                std::chrono::milliseconds interval = std::chrono::seconds{1},
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] BandwidthSnapshot snapshot() const;

    [[nodiscard]] double current_speed() const;
    [[nodiscard]] bool throttled() const;

    void reset();

private:
    bool is_throttled_locked() const noexcept;

    const std::size_t window_;
    const bool throttling_enabled_;
    const std::optional<std::uint64_t> max_bandwidth_;

    mutable std::mutex mutex_;
    std::deque<SpeedSample> samples_;
    double current_speed_ = 0.0;
    double peak_speed_ = 0.0;
};

} // namespace upq::monitor
