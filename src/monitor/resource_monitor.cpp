#include "upq/monitor/resource_monitor.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <string>

#include <sys/resource.h>

namespace upq::monitor {

ResourceUsage ResourceMonitor::sample(double network_bandwidth) {
    const auto now = std::chrono::steady_clock::now();
    const auto cpu_time = read_cpu_time();

    ResourceUsage usage;
    usage.memory_usage = read_resident_memory();
    usage.network_bandwidth = network_bandwidth;
    usage.sampled_at = std::chrono::system_clock::now();

    std::lock_guard lock(mutex_);
    if (cpu_time && last_cpu_time_ && last_sample_at_) {
        const auto wall = std::chrono::duration_cast<std::chrono::microseconds>(now - *last_sample_at_);
        if (wall.count() > 0) {
            const auto busy = *cpu_time - *last_cpu_time_;
            usage.cpu_usage = static_cast<double>(busy.count()) / static_cast<double>(wall.count()) * 100.0;
        }
    }
    last_cpu_time_ = cpu_time;
    last_sample_at_ = now;
    latest_ = usage;
    return usage;
}

ResourceUsage ResourceMonitor::latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
}

std::uint64_t ResourceMonitor::read_resident_memory() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (status && std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) != 0) {
            continue;
        }
        std::istringstream fields(line.substr(6));
        std::uint64_t kilobytes = 0;
        if (fields >> kilobytes) {
            return kilobytes * 1024;
        }
        break;
    }

    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return static_cast<std::uint64_t>(usage.ru_maxrss) * 1024;  // Linux reports kB
    }

    spdlog::debug("Resident memory unavailable");
    return 0;
}

std::optional<std::chrono::microseconds> ResourceMonitor::read_cpu_time() {
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return std::nullopt;
    }
    const auto to_us = [](const timeval& tv) {
        return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
    };
    return std::chrono::duration_cast<std::chrono::microseconds>(to_us(usage.ru_utime) + to_us(usage.ru_stime));
}

} // namespace upq::monitor
