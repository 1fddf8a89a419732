#pragma once

/**
 * @file executors.hpp
 * @brief Strategy executors: turn one queue item into transport calls
 *
 * WHAT IT DOES:
 * - Single: one Whole payload for the full file
 * - Chunked: validates the chunk plan, sends chunks sequentially with
 *   per-chunk retry/backoff, then a Finalize payload
 * - Streaming: sequential StreamSegment payloads, the last flagged final
 * - Batch: one Whole payload tagged with the batch id and size
 *
 * The executor owns no queue state. It reports progress and chunk state back
 * through a TransferObserver and returns the final transport result; the
 * scheduler decides what that means for the item.
 */

#include "upq/core/cancellation.hpp"
#include "upq/queue/types.hpp"
#include "upq/transfer/transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace upq::transfer {

struct TransferRequest {
    std::string item_id;
    std::string session_id;
    queue::FileSource file;
    std::uint64_t total_bytes = 0;
    queue::TransferStrategy strategy;
    std::vector<queue::UploadChunk> chunks;   ///< chunked strategy only
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Callbacks from a running executor
 *
 * Invoked on the transfer worker thread. Implementations must not block.
 */
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    // Confirmed bytes for the whole item, never decreasing within one execute()
    virtual void on_progress(std::uint64_t uploaded_bytes, std::chrono::milliseconds elapsed) = 0;
    virtual void on_chunk_update(const queue::UploadChunk& chunk) = 0;
    // All chunks are in; the finalize call is about to be made
    virtual void on_finalizing() = 0;
};

class TransferExecutor {
public:
    explicit TransferExecutor(Transport& transport) : transport_(transport) {}

    TransportResult execute(const TransferRequest& request,
                            TransferObserver& observer,
                            const CancellationToken& token);

private:
    class Run;

    TransportResult run_single(Run& run, const queue::SingleParams& params);
    TransportResult run_chunked(Run& run, const queue::ChunkedParams& params);
    TransportResult run_streaming(Run& run, const queue::StreamingParams& params);
    TransportResult run_batch(Run& run, const queue::BatchParams& params);

    // Calls the transport, turning an escaped exception into a TransportError
    TransportResult call(const UploadPayload& payload,
                         const ProgressCallback& on_progress,
                         const CancellationToken& token);

    Transport& transport_;
};

} // namespace upq::transfer
