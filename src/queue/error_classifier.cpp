#include "upq/queue/error_classifier.hpp"

#include <algorithm>
#include <array>

namespace upq::queue {
namespace {

constexpr std::array<int, 6> kRetryableStatuses{408, 429, 500, 502, 503, 504};

bool matches(const transfer::TransportError& error, const char* name, const char* code) noexcept {
    return error.name == name || error.code == code;
}

} // namespace

ErrorType classify_error(const transfer::TransportError& error) noexcept {
    if (matches(error, "NetworkError", "NETWORK_ERROR")) {
        return ErrorType::Network;
    }
    if (matches(error, "TimeoutError", "TIMEOUT")) {
        return ErrorType::Timeout;
    }
    if (matches(error, "ValidationError", "VALIDATION_ERROR")) {
        return ErrorType::Validation;
    }
    if (error.status) {
        if (*error.status >= 500) {
            return ErrorType::Server;
        }
        if (*error.status >= 400) {
            return ErrorType::Client;
        }
    }
    if (error.code == "SERVER_ERROR") {
        return ErrorType::Server;
    }
    return ErrorType::Client;
}

bool is_retryable(const transfer::TransportError& error) noexcept {
    const auto type = classify_error(error);
    if (type == ErrorType::Validation) {
        return false;
    }
    if (type == ErrorType::Network || type == ErrorType::Server || type == ErrorType::Timeout) {
        return true;
    }
    return error.status &&
           std::find(kRetryableStatuses.begin(), kRetryableStatuses.end(), *error.status) != kRetryableStatuses.end();
}

QueueError make_queue_error(const transfer::TransportError& error, Clock::time_point timestamp) {
    QueueError queue_error;
    queue_error.timestamp = timestamp;
    queue_error.type = classify_error(error);
    queue_error.message = error.message.empty() ? std::string("Upload failed") : error.message;
    if (!error.code.empty()) {
        queue_error.code = error.code;
    }
    queue_error.retryable = is_retryable(error);

    queue_error.details = nlohmann::json::object();
    if (!error.name.empty()) {
        queue_error.details["name"] = error.name;
    }
    if (error.status) {
        queue_error.details["status"] = *error.status;
    }
    if (!error.details.is_null()) {
        queue_error.details["transport"] = error.details;
    }
    return queue_error;
}

} // namespace upq::queue
