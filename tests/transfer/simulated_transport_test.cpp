#include "upq/transfer/simulated_transport.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace std::chrono_literals;
using upq::CancelReason;
using upq::CancellationToken;
using upq::transfer::PayloadKind;
using upq::transfer::SimulatedTransport;
using upq::transfer::UploadPayload;

namespace {

UploadPayload payload_of(std::uint64_t length, PayloadKind kind = PayloadKind::Whole) {
    UploadPayload payload;
    payload.item_id = "upload-1";
    payload.kind = kind;
    payload.length = length;
    return payload;
}

SimulatedTransport::Options fast_options() {
    SimulatedTransport::Options options;
    options.bytes_per_second = 100000.0;
    options.step_interval = 1ms;
    return options;
}

} // namespace

TEST(SimulatedTransportTest, ReportsMonotonicProgressToCompletion) {
    SimulatedTransport transport(fast_options());
    CancellationToken token;
    std::vector<std::uint64_t> progress;

    const auto result = transport.upload(payload_of(1000), [&](std::uint64_t sent) { progress.push_back(sent); },
                                         token);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().body["bytes"], 1000);
    ASSERT_GE(progress.size(), 2u);
    EXPECT_EQ(progress.front(), 0u);
    EXPECT_EQ(progress.back(), 1000u);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i], progress[i - 1]);
    }
    EXPECT_EQ(transport.calls(), 1u);
}

TEST(SimulatedTransportTest, FinalizeAssembles) {
    SimulatedTransport transport(fast_options());
    CancellationToken token;

    const auto result = transport.upload(payload_of(5000, PayloadKind::Finalize), [](std::uint64_t) {}, token);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().body["assembled"], true);
}

TEST(SimulatedTransportTest, CertainFailureRateAlwaysFails) {
    auto options = fast_options();
    options.failure_rate = 1.0;
    SimulatedTransport transport(options);
    CancellationToken token;

    const auto even = transport.upload(payload_of(10), [](std::uint64_t) {}, token);
    ASSERT_TRUE(even.is_error());
    EXPECT_EQ(even.error().code, "NETWORK_ERROR");

    const auto odd = transport.upload(payload_of(11), [](std::uint64_t) {}, token);
    ASSERT_TRUE(odd.is_error());
    EXPECT_EQ(odd.error().status, std::optional<int>{503});
}

TEST(SimulatedTransportTest, CancellationStopsTransfer) {
    SimulatedTransport::Options options;
    options.bytes_per_second = 1000.0;
    options.step_interval = 10ms;
    SimulatedTransport transport(options);
    CancellationToken token;

    std::thread canceller([&token] {
        std::this_thread::sleep_for(30ms);
        token.cancel(CancelReason::Paused);
    });
    const auto result = transport.upload(payload_of(1000000), [](std::uint64_t) {}, token);
    canceller.join();

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, "ABORTED");
}
