#include "upq/queue/error_classifier.hpp"

#include <gtest/gtest.h>

using upq::queue::ErrorType;
using upq::queue::classify_error;
using upq::queue::is_retryable;
using upq::queue::make_queue_error;
using upq::transfer::TransportError;

namespace {

TransportError raw(std::string name, std::string code, std::optional<int> status = std::nullopt) {
    TransportError error;
    error.name = std::move(name);
    error.code = std::move(code);
    error.status = status;
    error.message = "boom";
    return error;
}

} // namespace

TEST(ErrorClassifierTest, SentinelsWinOverStatus) {
    EXPECT_EQ(classify_error(raw("NetworkError", "")), ErrorType::Network);
    EXPECT_EQ(classify_error(raw("", "NETWORK_ERROR")), ErrorType::Network);
    EXPECT_EQ(classify_error(raw("TimeoutError", "", 400)), ErrorType::Timeout);
    EXPECT_EQ(classify_error(raw("", "TIMEOUT")), ErrorType::Timeout);
    EXPECT_EQ(classify_error(TransportError::validation("bad plan")), ErrorType::Validation);
}

TEST(ErrorClassifierTest, StatusRanges) {
    EXPECT_EQ(classify_error(TransportError::http(500, "")), ErrorType::Server);
    EXPECT_EQ(classify_error(TransportError::http(503, "")), ErrorType::Server);
    EXPECT_EQ(classify_error(TransportError::http(400, "")), ErrorType::Client);
    EXPECT_EQ(classify_error(TransportError::http(404, "")), ErrorType::Client);
    EXPECT_EQ(classify_error(TransportError::http(429, "")), ErrorType::Client);
}

TEST(ErrorClassifierTest, DefaultsToClient) {
    EXPECT_EQ(classify_error(raw("Weird", "EWHATEVER")), ErrorType::Client);
    EXPECT_EQ(classify_error(TransportError{}), ErrorType::Client);
    EXPECT_EQ(classify_error(raw("", "SERVER_ERROR")), ErrorType::Server);
}

TEST(ErrorClassifierTest, RetryablePolicy) {
    EXPECT_TRUE(is_retryable(TransportError::network("reset")));
    EXPECT_TRUE(is_retryable(TransportError::timeout("slow")));
    EXPECT_TRUE(is_retryable(TransportError::http(502, "")));
    EXPECT_TRUE(is_retryable(TransportError::http(408, "")));
    EXPECT_TRUE(is_retryable(TransportError::http(429, "")));

    EXPECT_FALSE(is_retryable(TransportError::http(400, "")));
    EXPECT_FALSE(is_retryable(TransportError::http(404, "")));
    EXPECT_FALSE(is_retryable(TransportError::validation("bad range")));
    EXPECT_FALSE(is_retryable(raw("Weird", "EWHATEVER")));
}

TEST(ErrorClassifierTest, DeterministicForSameInput) {
    const auto error = TransportError::http(503, "unavailable");
    EXPECT_EQ(classify_error(error), classify_error(error));
    EXPECT_EQ(is_retryable(error), is_retryable(error));
}

TEST(ErrorClassifierTest, BuildsQueueError) {
    const auto timestamp = upq::queue::Clock::now();
    auto error = TransportError::http(503, "unavailable");
    error.details = {{"attempt", 2}};

    const auto queue_error = make_queue_error(error, timestamp);
    EXPECT_EQ(queue_error.type, ErrorType::Server);
    EXPECT_EQ(queue_error.message, "unavailable");
    ASSERT_TRUE(queue_error.code.has_value());
    EXPECT_EQ(*queue_error.code, "HTTP_503");
    EXPECT_TRUE(queue_error.retryable);
    EXPECT_EQ(queue_error.timestamp, timestamp);
    EXPECT_EQ(queue_error.details["status"], 503);
    EXPECT_EQ(queue_error.details["transport"]["attempt"], 2);
}

TEST(ErrorClassifierTest, EmptyMessageGetsDefault) {
    EXPECT_EQ(make_queue_error(TransportError{}).message, "Upload failed");
}
