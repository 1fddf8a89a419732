#include "upq/queue/types.hpp"

namespace upq::queue {

const char* to_string(Priority priority) {
    switch (priority) {
        case Priority::Urgent: return "urgent";
        case Priority::High: return "high";
        case Priority::Normal: return "normal";
        case Priority::Low: return "low";
    }
    return "unknown";
}

const char* to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::Queued: return "queued";
        case ItemStatus::Uploading: return "uploading";
        case ItemStatus::Processing: return "processing";
        case ItemStatus::Paused: return "paused";
        case ItemStatus::Completed: return "completed";
        case ItemStatus::Failed: return "failed";
        case ItemStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Uploading: return "uploading";
        case ChunkStatus::Completed: return "completed";
        case ChunkStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::Network: return "network";
        case ErrorType::Server: return "server";
        case ErrorType::Client: return "client";
        case ErrorType::Validation: return "validation";
        case ErrorType::Timeout: return "timeout";
    }
    return "unknown";
}

const char* to_string(StrategyType type) {
    switch (type) {
        case StrategyType::Single: return "single";
        case StrategyType::Chunked: return "chunked";
        case StrategyType::Streaming: return "streaming";
        case StrategyType::Batch: return "batch";
    }
    return "unknown";
}

std::optional<Priority> priority_from_string(std::string_view name) {
    if (name == "urgent") return Priority::Urgent;
    if (name == "high") return Priority::High;
    if (name == "normal") return Priority::Normal;
    if (name == "low") return Priority::Low;
    return std::nullopt;
}

std::optional<StrategyType> strategy_type_from_string(std::string_view name) {
    if (name == "single") return StrategyType::Single;
    if (name == "chunked") return StrategyType::Chunked;
    if (name == "streaming") return StrategyType::Streaming;
    if (name == "batch") return StrategyType::Batch;
    return std::nullopt;
}

bool TransferStrategy::resumable() const noexcept {
    if (const auto* chunked = std::get_if<ChunkedParams>(&params)) {
        return chunked->resumable;
    }
    if (const auto* single = std::get_if<SingleParams>(&params)) {
        return single->resumable;
    }
    return false;
}

bool TransferStrategy::checksum_validation() const noexcept {
    if (const auto* chunked = std::get_if<ChunkedParams>(&params)) {
        return chunked->checksum_validation;
    }
    if (const auto* single = std::get_if<SingleParams>(&params)) {
        return single->checksum_validation;
    }
    if (const auto* streaming = std::get_if<StreamingParams>(&params)) {
        return streaming->checksum_validation;
    }
    return false;
}

TransferStrategy TransferStrategy::single(SingleParams params) {
    return TransferStrategy{"single-standard", "Single File Upload", params};
}

TransferStrategy TransferStrategy::chunked(ChunkedParams params) {
    return TransferStrategy{"chunked-large", "Chunked Upload for Large Files", params};
}

TransferStrategy TransferStrategy::streaming(StreamingParams params) {
    return TransferStrategy{"streaming", "Streaming Upload", params};
}

TransferStrategy TransferStrategy::batch(BatchParams params) {
    return TransferStrategy{"batch", "Batch Upload", std::move(params)};
}

} // namespace upq::queue
