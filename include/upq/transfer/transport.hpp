#pragma once

/**
 * @file transport.hpp
 * @brief Contract of the byte-moving collaborator
 *
 * WHY THIS FILE EXISTS:
 * The queue decides what to send, when and how many at once. Actually moving
 * bytes (HTTP multipart, object storage, ...) is somebody else's job. This
 * header is the seam: the strategy executors build UploadPayloads and hand
 * them to a Transport together with a progress callback and a cancellation
 * token.
 *
 * CONTRACT FOR IMPLEMENTATIONS:
 * - upload() may block; it runs on a transfer worker thread, never on the
 *   admission loop
 * - progress must be reported as monotonically non-decreasing bytes sent for
 *   the current payload
 * - the cancellation token must be polled; once it trips, return promptly
 *   (any error is fine, the result of a cancelled call is discarded)
 */

#include "upq/core/cancellation.hpp"
#include "upq/core/result.hpp"
#include "upq/queue/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace upq::transfer {

enum class PayloadKind {
    Whole,          // single-shot or batch upload of the full file
    Chunk,          // one byte range of a chunked upload
    StreamSegment,  // one segment of a streaming upload
    Finalize        // ask the receiver to assemble previously sent chunks
};

const char* to_string(PayloadKind kind);

struct UploadPayload {
    std::string item_id;
    std::string session_id;
    queue::FileSource file;
    PayloadKind kind = PayloadKind::Whole;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::optional<std::uint32_t> chunk_index;
    std::optional<std::uint32_t> total_chunks;
    std::optional<std::string> checksum;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief Raw failure as reported by a transport, before classification
 *
 * Fields mirror what HTTP stacks usually expose: an error name
 * ("NetworkError", "TimeoutError"), a code ("NETWORK_ERROR", "ECONNRESET"),
 * an optional HTTP status and free-form details.
 */
struct TransportError {
    std::string name;
    std::string code;
    std::optional<int> status;
    std::string message;
    nlohmann::json details;

    static TransportError network(std::string message);
    static TransportError timeout(std::string message);
    static TransportError validation(std::string message);
    static TransportError http(int status, std::string message);
    static TransportError aborted(CancelReason reason);
};

struct TransportResponse {
    int status = 200;
    nlohmann::json body;
};

using TransportResult = upq::Result<TransportResponse, TransportError>;

// Bytes of the current payload handed to the wire so far
using ProgressCallback = std::function<void(std::uint64_t bytes_sent)>;

class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportResult upload(const UploadPayload& payload,
                                   const ProgressCallback& on_progress,
                                   const CancellationToken& token) = 0;
};

} // namespace upq::transfer
