#pragma once

#include "upq/queue/types.hpp"
#include "upq/transfer/transport.hpp"

namespace upq::queue {

/**
 * @brief Map a raw transport failure onto the error taxonomy
 *
 * ORDER:
 * 1. name/code sentinels: NetworkError / NETWORK_ERROR → Network,
 *    TimeoutError / TIMEOUT → Timeout, ValidationError / VALIDATION_ERROR → Validation
 * 2. status >= 500 → Server, 400..499 → Client
 * 3. code SERVER_ERROR → Server
 * 4. anything else → Client
 *
 * Total and deterministic.
 */
ErrorType classify_error(const transfer::TransportError& error) noexcept;

/**
 * @brief Whether the failure may be retried automatically
 *
 * True for Network, Server and Timeout failures and for the statuses
 * 408, 429, 500, 502, 503, 504. Validation failures are never retryable.
 */
bool is_retryable(const transfer::TransportError& error) noexcept;

QueueError make_queue_error(const transfer::TransportError& error,
                            Clock::time_point timestamp = Clock::now());

} // namespace upq::queue
