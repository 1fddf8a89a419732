#include "upq/transfer/transport.hpp"

namespace upq::transfer {

const char* to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::Whole: return "whole";
        case PayloadKind::Chunk: return "chunk";
        case PayloadKind::StreamSegment: return "stream-segment";
        case PayloadKind::Finalize: return "finalize";
    }
    return "unknown";
}

TransportError TransportError::network(std::string message) {
    TransportError error;
    error.name = "NetworkError";
    error.code = "NETWORK_ERROR";
    error.message = std::move(message);
    return error;
}

TransportError TransportError::timeout(std::string message) {
    TransportError error;
    error.name = "TimeoutError";
    error.code = "TIMEOUT";
    error.message = std::move(message);
    return error;
}

TransportError TransportError::validation(std::string message) {
    TransportError error;
    error.name = "ValidationError";
    error.code = "VALIDATION_ERROR";
    error.message = std::move(message);
    return error;
}

TransportError TransportError::http(int status, std::string message) {
    TransportError error;
    error.name = "HttpError";
    error.code = "HTTP_" + std::to_string(status);
    error.status = status;
    error.message = std::move(message);
    return error;
}

TransportError TransportError::aborted(CancelReason reason) {
    TransportError error;
    error.name = "AbortError";
    error.code = "ABORTED";
    error.message = std::string("Transfer aborted: ") + upq::to_string(reason);
    return error;
}

} // namespace upq::transfer
