#pragma once

/**
 * @file types.hpp
 * @brief Data model of the upload queue
 *
 * WHY THIS FILE EXISTS:
 * Every component (scheduler, executors, statistics, monitors, events) talks
 * about the same few records: a QueueItem per requested transfer, its
 * UploadChunk slices and the QueueError log. Keeping them in one header lets
 * the executors and the scheduler agree on the model without depending on
 * each other.
 *
 * OWNERSHIP:
 * The scheduler owns and mutates QueueItem/UploadChunk state. Everyone else
 * works on copies (get_queue(), executor requests) or reads through events.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace upq::queue {

using Clock = std::chrono::system_clock;

enum class Priority {
    Urgent,
    High,
    Normal,
    Low
};

/**
 * @brief Item state machine
 *
 * TRANSITIONS:
 * Queued     → Uploading (admitted), Cancelled
 * Uploading  → Processing (finalizing), Completed, Failed, Paused, Cancelled
 * Processing → Completed, Failed, Cancelled
 * Paused     → Queued (resume), Cancelled
 * Failed     → Queued (automatic or manual retry), Cancelled
 *
 * Completed and Cancelled are terminal. Failed is terminal only once retries
 * are exhausted or the caller abandons the item.
 */
enum class ItemStatus {
    Queued,
    Uploading,
    Processing,
    Paused,
    Completed,
    Failed,
    Cancelled
};

enum class ChunkStatus {
    Pending,
    Uploading,
    Completed,
    Failed
};

enum class ErrorType {
    Network,     // connectivity lost
    Server,      // remote 5xx / internal fault
    Client,      // 4xx / malformed request
    Validation,  // local precondition failure, never retried
    Timeout      // no progress within bound
};

enum class StrategyType {
    Single,
    Chunked,
    Streaming,
    Batch
};

const char* to_string(Priority priority);
const char* to_string(ItemStatus status);
const char* to_string(ChunkStatus status);
const char* to_string(ErrorType type);
const char* to_string(StrategyType type);

std::optional<Priority> priority_from_string(std::string_view name);
std::optional<StrategyType> strategy_type_from_string(std::string_view name);

/**
 * @brief Reference to the file being uploaded
 *
 * `path` is optional: transports that already hold the bytes (or tests) can
 * describe a file by name and size only. Checksums need a readable path.
 */
struct FileSource {
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::filesystem::path path;
};

/**
 * @brief Immutable record of one classified failure
 */
struct QueueError {
    Clock::time_point timestamp{};
    ErrorType type = ErrorType::Client;
    std::string message;
    std::optional<std::string> code;
    bool retryable = false;
    nlohmann::json details;
};

/**
 * @brief One byte-range slice of a chunked transfer, covering [start, end)
 */
struct UploadChunk {
    std::uint32_t index = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t size = 0;
    ChunkStatus status = ChunkStatus::Pending;
    std::uint32_t retry_count = 0;
    std::optional<std::string> checksum;
    std::optional<Clock::time_point> completed_at;
};

// ════════════════════════════════════════════════════════
// Strategy parameters (closed set, selected by variant index)
// ════════════════════════════════════════════════════════

struct SingleParams {
    bool checksum_validation = false;
    bool resumable = false;
};

struct ChunkedParams {
    std::uint64_t chunk_size = 1024 * 1024;
    std::uint32_t max_retries = 3;                   ///< attempts per chunk
    std::chrono::milliseconds retry_delay{1000};     ///< base of per-chunk backoff
    std::uint32_t parallel_chunks = 3;               ///< reserved, chunks go sequentially
    bool checksum_validation = true;
    bool resumable = true;
};

struct StreamingParams {
    std::uint64_t segment_size = 256 * 1024;
    bool checksum_validation = false;
};

struct BatchParams {
    std::string batch_id;
    std::size_t batch_size = 1;
};

// Order must match StrategyType
using StrategyParams = std::variant<SingleParams, ChunkedParams, StreamingParams, BatchParams>;

struct TransferStrategy {
    std::string id;
    std::string name;
    StrategyParams params;

    StrategyType type() const noexcept {
        return static_cast<StrategyType>(params.index());
    }

    bool resumable() const noexcept;
    bool checksum_validation() const noexcept;

    static TransferStrategy single(SingleParams params = {});
    static TransferStrategy chunked(ChunkedParams params);
    static TransferStrategy streaming(StreamingParams params = {});
    static TransferStrategy batch(BatchParams params);
};

/**
 * @brief One requested transfer and its mutable progress
 *
 * INVARIANTS:
 * - uploaded_bytes <= total_bytes
 * - progress == 100 iff status == Completed
 * - chunks is non-empty only for the chunked strategy and covers [0, total_bytes)
 */
struct QueueItem {
    std::string id;
    std::string session_id;
    FileSource file;
    Priority priority = Priority::Normal;
    ItemStatus status = ItemStatus::Queued;

    double progress = 0.0;                                   ///< 0-100
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double speed = 0.0;                                      ///< bytes per second
    std::optional<std::chrono::milliseconds> time_remaining; ///< empty while speed is 0

    std::uint32_t retry_count = 0;
    std::vector<QueueError> errors;                          ///< append-only

    TransferStrategy strategy;
    std::vector<UploadChunk> chunks;

    std::uint64_t sequence = 0;                              ///< enqueue order, FIFO tie-break
    Clock::time_point added_at{};
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> paused_at;
    std::optional<Clock::time_point> completed_at;

    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Snapshot derived from the item collection on every read
 */
struct QueueStatistics {
    std::size_t total_items = 0;
    std::size_t queued_items = 0;
    std::size_t uploading_items = 0;
    std::size_t processing_items = 0;
    std::size_t paused_items = 0;
    std::size_t completed_items = 0;
    std::size_t failed_items = 0;
    std::size_t cancelled_items = 0;

    std::uint64_t total_size = 0;
    std::uint64_t total_uploaded = 0;
    double overall_progress = 0.0;                      ///< 0-100
    double average_speed = 0.0;                         ///< bytes per second, active items
    std::chrono::milliseconds estimated_time_remaining{0};
    double success_rate = 0.0;                          ///< 0-1
    double error_rate = 0.0;                            ///< 0-1
};

} // namespace upq::queue
