#include "upq/transfer/simulated_transport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace upq::transfer {

SimulatedTransport::SimulatedTransport() : SimulatedTransport(Options{}) {}

SimulatedTransport::SimulatedTransport(Options options)
    : options_(options), rng_(options.seed) {
    options_.bytes_per_second = std::max(1.0, options_.bytes_per_second);
    if (options_.step_interval.count() <= 0) {
        options_.step_interval = std::chrono::milliseconds{1};
    }
}

TransportResult SimulatedTransport::upload(const UploadPayload& payload,
                                           const ProgressCallback& on_progress,
                                           const CancellationToken& token) {
    {
        std::lock_guard lock(mutex_);
        ++calls_;
    }

    if (payload.kind == PayloadKind::Finalize) {
        if (token.wait_for(options_.step_interval)) {
            return Err<TransportResponse>(TransportError::aborted(token.reason()));
        }
        TransportResponse response;
        response.body = {{"itemId", payload.item_id}, {"assembled", true}, {"bytes", payload.length}};
        return Ok<TransportResponse, TransportError>(std::move(response));
    }

    if (roll_failure()) {
        spdlog::debug("[SimulatedTransport] injecting failure for item={}", payload.item_id);
        if (payload.length % 2 == 0) {
            return Err<TransportResponse>(TransportError::network("simulated connection reset"));
        }
        return Err<TransportResponse>(TransportError::http(503, "simulated service unavailable"));
    }

    const double step_seconds = std::chrono::duration<double>(options_.step_interval).count();
    const auto per_step = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(options_.bytes_per_second * step_seconds));

    std::uint64_t sent = 0;
    on_progress(0);
    while (sent < payload.length) {
        if (token.wait_for(options_.step_interval)) {
            return Err<TransportResponse>(TransportError::aborted(token.reason()));
        }
        sent = std::min(payload.length, sent + per_step);
        on_progress(sent);
    }

    TransportResponse response;
    response.body = {{"itemId", payload.item_id},
                     {"kind", to_string(payload.kind)},
                     {"offset", payload.offset},
                     {"bytes", sent}};
    return Ok<TransportResponse, TransportError>(std::move(response));
}

std::uint64_t SimulatedTransport::calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

bool SimulatedTransport::roll_failure() {
    if (options_.failure_rate <= 0.0) {
        return false;
    }
    std::lock_guard lock(mutex_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < options_.failure_rate;
}

} // namespace upq::transfer
