#include "upq/queue/serializer.hpp"

#include <type_traits>
#include <variant>

namespace upq::queue {

using json = nlohmann::json;

namespace {

json optional_time(const std::optional<Clock::time_point>& time) {
    return time ? json(to_epoch_ms(*time)) : json(nullptr);
}

json params_to_json(const StrategyParams& params) {
    return std::visit(
        [](const auto& p) -> json {
            using P = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<P, SingleParams>) {
                return {{"checksumValidation", p.checksum_validation}, {"resumable", p.resumable}};
            } else if constexpr (std::is_same_v<P, ChunkedParams>) {
                return {{"chunkSize", p.chunk_size},
                        {"maxRetries", p.max_retries},
                        {"retryDelay", p.retry_delay.count()},
                        {"parallelChunks", p.parallel_chunks},
                        {"checksumValidation", p.checksum_validation},
                        {"resumable", p.resumable}};
            } else if constexpr (std::is_same_v<P, StreamingParams>) {
                return {{"segmentSize", p.segment_size}, {"checksumValidation", p.checksum_validation}};
            } else {
                return {{"batchId", p.batch_id}, {"batchSize", p.batch_size}};
            }
        },
        params);
}

} // namespace

std::int64_t to_epoch_ms(Clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

json error_to_json(const QueueError& error) {
    json j;
    j["timestamp"] = to_epoch_ms(error.timestamp);
    j["type"] = to_string(error.type);
    j["message"] = error.message;
    j["code"] = error.code ? json(*error.code) : json(nullptr);
    j["retryable"] = error.retryable;
    j["details"] = error.details.is_null() ? json::object() : error.details;
    return j;
}

json chunk_to_json(const UploadChunk& chunk) {
    return {{"index", chunk.index},
            {"start", chunk.start},
            {"end", chunk.end},
            {"size", chunk.size},
            {"status", to_string(chunk.status)},
            {"retryCount", chunk.retry_count},
            {"checksum", chunk.checksum ? json(*chunk.checksum) : json(nullptr)},
            {"completedAt", optional_time(chunk.completed_at)}};
}

json strategy_to_json(const TransferStrategy& strategy) {
    return {{"id", strategy.id},
            {"name", strategy.name},
            {"type", to_string(strategy.type())},
            {"parameters", params_to_json(strategy.params)}};
}

json item_to_json(const QueueItem& item) {
    json j;
    j["id"] = item.id;
    j["sessionId"] = item.session_id;
    j["file"] = {{"name", item.file.name}, {"size", item.file.size}, {"type", item.file.mime_type}};
    j["priority"] = to_string(item.priority);
    j["status"] = to_string(item.status);
    j["progress"] = item.progress;
    j["uploadedBytes"] = item.uploaded_bytes;
    j["totalBytes"] = item.total_bytes;
    j["speed"] = item.speed;
    j["timeRemaining"] = item.time_remaining ? json(item.time_remaining->count()) : json(nullptr);
    j["retryCount"] = item.retry_count;

    j["errors"] = json::array();
    for (const auto& error : item.errors) {
        j["errors"].push_back(error_to_json(error));
    }

    j["strategy"] = strategy_to_json(item.strategy);
    if (item.strategy.type() == StrategyType::Chunked) {
        j["chunks"] = json::array();
        for (const auto& chunk : item.chunks) {
            j["chunks"].push_back(chunk_to_json(chunk));
        }
    }

    j["addedAt"] = to_epoch_ms(item.added_at);
    j["startedAt"] = optional_time(item.started_at);
    j["pausedAt"] = optional_time(item.paused_at);
    j["completedAt"] = optional_time(item.completed_at);
    j["metadata"] = item.metadata;
    return j;
}

json statistics_to_json(const QueueStatistics& stats) {
    return {{"totalItems", stats.total_items},
            {"queuedItems", stats.queued_items},
            {"uploadingItems", stats.uploading_items},
            {"processingItems", stats.processing_items},
            {"pausedItems", stats.paused_items},
            {"completedItems", stats.completed_items},
            {"failedItems", stats.failed_items},
            {"cancelledItems", stats.cancelled_items},
            {"totalSize", stats.total_size},
            {"totalUploaded", stats.total_uploaded},
            {"overallProgress", stats.overall_progress},
            {"averageSpeed", stats.average_speed},
            {"estimatedTimeRemaining", stats.estimated_time_remaining.count()},
            {"successRate", stats.success_rate},
            {"errorRate", stats.error_rate}};
}

json bandwidth_to_json(const monitor::BandwidthSnapshot& snapshot) {
    json samples = json::array();
    for (const auto& sample : snapshot.samples) {
        samples.push_back({{"timestamp", to_epoch_ms(sample.timestamp)},
                           {"bytesTransferred", sample.bytes_transferred},
                           {"speed", sample.speed}});
    }
    return {{"currentSpeed", snapshot.current_speed},
            {"averageSpeed", snapshot.average_speed},
            {"peakSpeed", snapshot.peak_speed},
            {"throttled", snapshot.throttled},
            {"samples", std::move(samples)}};
}

json resource_to_json(const monitor::ResourceUsage& usage) {
    return {{"cpuUsage", usage.cpu_usage},
            {"memoryUsage", usage.memory_usage},
            {"networkBandwidth", usage.network_bandwidth},
            {"sampledAt", to_epoch_ms(usage.sampled_at)}};
}

} // namespace upq::queue
