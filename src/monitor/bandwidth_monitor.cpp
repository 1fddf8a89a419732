#include "upq/monitor/bandwidth_monitor.hpp"

#include <algorithm>

namespace upq::monitor {

BandwidthMonitor::BandwidthMonitor(std::size_t window,
                                   bool throttling_enabled,
                                   std::optional<std::uint64_t> max_bandwidth)
    : window_(std::max<std::size_t>(1, window)),
      throttling_enabled_(throttling_enabled),
      max_bandwidth_(max_bandwidth) {
}

void BandwidthMonitor::record(double speed,
                              std::chrono::milliseconds interval,
                              std::chrono::system_clock::time_point now) {
    speed = std::max(0.0, speed);

    SpeedSample sample;
    sample.timestamp = now;
    sample.speed = speed;
    sample.bytes_transferred = speed * std::chrono::duration<double>(interval).count();

    std::lock_guard lock(mutex_);
    samples_.push_back(sample);
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
    current_speed_ = speed;
    peak_speed_ = std::max(peak_speed_, speed);
}

BandwidthSnapshot BandwidthMonitor::snapshot() const {
    std::lock_guard lock(mutex_);
    BandwidthSnapshot snapshot;
    snapshot.current_speed = current_speed_;
    snapshot.peak_speed = peak_speed_;
    snapshot.samples.assign(samples_.begin(), samples_.end());
    if (!samples_.empty()) {
        double total = 0.0;
        for (const auto& sample : samples_) {
            total += sample.speed;
        }
        snapshot.average_speed = total / static_cast<double>(samples_.size());
    }
    snapshot.throttled = is_throttled_locked();
    return snapshot;
}

double BandwidthMonitor::current_speed() const {
    std::lock_guard lock(mutex_);
    return current_speed_;
}

bool BandwidthMonitor::throttled() const {
    std::lock_guard lock(mutex_);
    return is_throttled_locked();
}

void BandwidthMonitor::reset() {
    std::lock_guard lock(mutex_);
    samples_.clear();
    current_speed_ = 0.0;
    peak_speed_ = 0.0;
}

bool BandwidthMonitor::is_throttled_locked() const noexcept {
    return throttling_enabled_ && max_bandwidth_.has_value() &&
           current_speed_ > static_cast<double>(*max_bandwidth_);
}

} // namespace upq::monitor
