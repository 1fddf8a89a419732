#pragma once

#include "upq/transfer/transport.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace upq::transfer {

/**
 * @brief In-process transport that pretends to move bytes at a fixed rate
 *
 * Used by the demo. Each upload advances in steps of `step_interval`, reports
 * progress after every step and honours the cancellation token between steps.
 * With `failure_rate` > 0 a call fails with a network or 503 error before any
 * bytes move; the generator is seeded so runs are reproducible.
 */
class SimulatedTransport : public Transport {
public:
    struct Options {
        double bytes_per_second = 4.0 * 1024 * 1024;
        std::chrono::milliseconds step_interval{50};
        double failure_rate = 0.0;
        std::uint32_t seed = 42;
    };

    SimulatedTransport();
    explicit SimulatedTransport(Options options);

    TransportResult upload(const UploadPayload& payload,
                           const ProgressCallback& on_progress,
                           const CancellationToken& token) override;

    std::uint64_t calls() const;

private:
    bool roll_failure();

    Options options_;
    mutable std::mutex mutex_;
    std::mt19937 rng_;
    std::uint64_t calls_ = 0;
};

} // namespace upq::transfer
