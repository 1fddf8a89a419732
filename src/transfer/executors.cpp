#include "upq/transfer/executors.hpp"

#include "upq/queue/admission.hpp"
#include "upq/queue/chunk_planner.hpp"
#include "upq/queue/error_classifier.hpp"
#include "upq/transfer/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <type_traits>
#include <variant>

namespace upq::transfer {

using queue::ChunkStatus;
using queue::UploadChunk;

/// Per-execute() bookkeeping shared by the strategy runners.
class TransferExecutor::Run {
public:
    Run(const TransferRequest& request, TransferObserver& observer, const CancellationToken& token)
        : request(request), observer(observer), token(token),
          started_(std::chrono::steady_clock::now()) {}

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
    }

    // Forwards progress, dropping anything that would move backwards
    void report(std::uint64_t bytes) {
        bytes = std::min(bytes, request.total_bytes);
        if (reported_ && bytes < *reported_) {
            return;
        }
        reported_ = bytes;
        observer.on_progress(bytes, elapsed());
    }

    UploadPayload payload(PayloadKind kind) const {
        UploadPayload payload;
        payload.item_id = request.item_id;
        payload.session_id = request.session_id;
        payload.file = request.file;
        payload.kind = kind;
        return payload;
    }

    TransportResult aborted() const {
        return Err<TransportResponse>(TransportError::aborted(token.reason()));
    }

    const TransferRequest& request;
    TransferObserver& observer;
    const CancellationToken& token;

private:
    std::chrono::steady_clock::time_point started_;
    std::optional<std::uint64_t> reported_;
};

TransportResult TransferExecutor::execute(const TransferRequest& request,
                                          TransferObserver& observer,
                                          const CancellationToken& token) {
    Run run(request, observer, token);
    if (token.is_cancelled()) {
        return run.aborted();
    }

    spdlog::debug("[Executor] item={} strategy={} bytes={}",
                  request.item_id, request.strategy.id, request.total_bytes);

    return std::visit(
        [&](const auto& params) -> TransportResult {
            using P = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<P, queue::SingleParams>) {
                return run_single(run, params);
            } else if constexpr (std::is_same_v<P, queue::ChunkedParams>) {
                return run_chunked(run, params);
            } else if constexpr (std::is_same_v<P, queue::StreamingParams>) {
                return run_streaming(run, params);
            } else {
                return run_batch(run, params);
            }
        },
        request.strategy.params);
}

TransportResult TransferExecutor::run_single(Run& run, const queue::SingleParams& params) {
    auto payload = run.payload(PayloadKind::Whole);
    payload.length = run.request.total_bytes;
    payload.metadata = run.request.metadata;
    if (params.checksum_validation) {
        payload.checksum = checksum_file_range(run.request.file.path, 0, run.request.total_bytes);
    }

    run.report(0);
    auto result = call(payload, [&run](std::uint64_t sent) { run.report(sent); }, run.token);
    if (result.is_ok()) {
        run.report(run.request.total_bytes);
    }
    return result;
}

TransportResult TransferExecutor::run_chunked(Run& run, const queue::ChunkedParams& params) {
    const auto& request = run.request;
    if (auto plan = queue::validate_chunk_plan(request.chunks, request.total_bytes); plan.is_error()) {
        spdlog::error("[Executor] item={} rejected chunk plan: {}", request.item_id, plan.error());
        return Err<TransportResponse>(TransportError::validation(plan.error()));
    }

    std::vector<UploadChunk> chunks = request.chunks;
    const auto total_chunks = static_cast<std::uint32_t>(chunks.size());
    const std::uint32_t budget = queue::attempt_budget(params.max_retries);

    std::uint64_t confirmed = 0;
    for (auto& chunk : chunks) {
        if (params.resumable && chunk.status == ChunkStatus::Completed) {
            confirmed += chunk.size;
        } else if (chunk.status != ChunkStatus::Pending) {
            chunk.status = ChunkStatus::Pending;
            chunk.completed_at.reset();
            run.observer.on_chunk_update(chunk);
        }
    }
    if (confirmed > 0) {
        spdlog::info("[Executor] item={} resuming at {}/{} bytes", request.item_id, confirmed, request.total_bytes);
    }
    run.report(confirmed);

    for (auto& chunk : chunks) {
        if (chunk.status == ChunkStatus::Completed) {
            continue;
        }

        auto payload = run.payload(PayloadKind::Chunk);
        payload.offset = chunk.start;
        payload.length = chunk.size;
        payload.chunk_index = chunk.index;
        payload.total_chunks = total_chunks;
        if (params.checksum_validation) {
            chunk.checksum = checksum_file_range(request.file.path, chunk.start, chunk.size);
            payload.checksum = chunk.checksum;
        }

        for (std::uint32_t attempt = 1;; ++attempt) {
            if (run.token.is_cancelled()) {
                return run.aborted();
            }

            chunk.status = ChunkStatus::Uploading;
            run.observer.on_chunk_update(chunk);

            const std::uint64_t base = confirmed;
            const std::uint64_t size = chunk.size;
            auto result = call(payload,
                               [&run, base, size](std::uint64_t sent) { run.report(base + std::min(sent, size)); },
                               run.token);

            if (result.is_ok()) {
                chunk.status = ChunkStatus::Completed;
                chunk.completed_at = queue::Clock::now();
                run.observer.on_chunk_update(chunk);
                confirmed += chunk.size;
                run.report(confirmed);
                spdlog::debug("[Executor] item={} chunk={}/{} done", request.item_id, chunk.index + 1, total_chunks);
                break;
            }

            if (run.token.is_cancelled()) {
                return run.aborted();
            }

            auto error = result.error();
            const auto classified = queue::make_queue_error(error);
            chunk.retry_count++;

            if (!queue::should_retry(classified, attempt, params.max_retries)) {
                chunk.status = ChunkStatus::Failed;
                run.observer.on_chunk_update(chunk);
                spdlog::error("[Executor] item={} chunk={} failed after {} attempt(s): {}",
                              request.item_id, chunk.index, attempt, error.message);
                if (!error.details.is_object()) {
                    error.details = nlohmann::json::object();
                }
                error.details["chunkIndex"] = chunk.index;
                error.details["attempts"] = attempt;
                return Err<TransportResponse>(std::move(error));
            }

            chunk.status = ChunkStatus::Pending;
            run.observer.on_chunk_update(chunk);

            const auto delay = queue::backoff_delay(params.retry_delay, attempt - 1);
            spdlog::warn("[Executor] item={} chunk={} attempt {}/{} failed ({}), retrying in {}ms",
                         request.item_id, chunk.index, attempt, budget, error.message, delay.count());
            if (run.token.wait_for(delay)) {
                return run.aborted();
            }
        }
    }

    if (run.token.is_cancelled()) {
        return run.aborted();
    }

    run.observer.on_finalizing();
    auto finalize = run.payload(PayloadKind::Finalize);
    finalize.length = request.total_bytes;
    finalize.total_chunks = total_chunks;
    finalize.metadata = request.metadata;
    nlohmann::json checksums = nlohmann::json::array();
    for (const auto& chunk : chunks) {
        checksums.push_back(chunk.checksum ? nlohmann::json(*chunk.checksum) : nlohmann::json(nullptr));
    }
    finalize.metadata["chunkChecksums"] = std::move(checksums);

    return call(finalize, [](std::uint64_t) {}, run.token);
}

TransportResult TransferExecutor::run_streaming(Run& run, const queue::StreamingParams& params) {
    const auto& request = run.request;
    const std::uint64_t segment_size = std::max<std::uint64_t>(1, params.segment_size);

    run.report(0);
    std::uint64_t offset = 0;
    std::uint32_t segment_index = 0;
    TransportResult last = Ok<TransportResponse, TransportError>(TransportResponse{});

    do {
        if (run.token.is_cancelled()) {
            return run.aborted();
        }

        const std::uint64_t length = std::min(segment_size, request.total_bytes - offset);
        const bool final_segment = offset + length >= request.total_bytes;

        auto payload = run.payload(PayloadKind::StreamSegment);
        payload.offset = offset;
        payload.length = length;
        payload.metadata["segmentIndex"] = segment_index;
        payload.metadata["final"] = final_segment;
        if (params.checksum_validation) {
            payload.checksum = checksum_file_range(request.file.path, offset, length);
        }

        const std::uint64_t base = offset;
        last = call(payload, [&run, base, length](std::uint64_t sent) { run.report(base + std::min(sent, length)); },
                    run.token);
        if (last.is_error()) {
            return run.token.is_cancelled() ? run.aborted() : last;
        }

        offset += length;
        ++segment_index;
        run.report(offset);
    } while (offset < request.total_bytes);

    return last;
}

TransportResult TransferExecutor::run_batch(Run& run, const queue::BatchParams& params) {
    auto payload = run.payload(PayloadKind::Whole);
    payload.length = run.request.total_bytes;
    payload.metadata = run.request.metadata;
    payload.metadata["batchId"] = params.batch_id;
    payload.metadata["batchSize"] = params.batch_size;

    run.report(0);
    auto result = call(payload, [&run](std::uint64_t sent) { run.report(sent); }, run.token);
    if (result.is_ok()) {
        run.report(run.request.total_bytes);
    }
    return result;
}

TransportResult TransferExecutor::call(const UploadPayload& payload,
                                       const ProgressCallback& on_progress,
                                       const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<TransportResponse>(TransportError::aborted(token.reason()));
    }
    try {
        return transport_.upload(payload, on_progress, token);
    } catch (const std::exception& e) {
        spdlog::error("[Executor] transport threw for item={} kind={}: {}",
                      payload.item_id, to_string(payload.kind), e.what());
        TransportError error;
        error.name = "TransportException";
        error.code = "TRANSPORT_EXCEPTION";
        error.message = e.what();
        error.details = {{"payloadKind", to_string(payload.kind)}};
        return Err<TransportResponse>(std::move(error));
    }
}

} // namespace upq::transfer
