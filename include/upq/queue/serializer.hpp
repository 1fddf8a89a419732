#pragma once

#include "upq/monitor/bandwidth_monitor.hpp"
#include "upq/monitor/resource_monitor.hpp"
#include "upq/queue/types.hpp"

#include <nlohmann/json.hpp>

namespace upq::queue {

// camelCase JSON views used in event payloads and by the demo

nlohmann::json error_to_json(const QueueError& error);
nlohmann::json chunk_to_json(const UploadChunk& chunk);
nlohmann::json strategy_to_json(const TransferStrategy& strategy);
nlohmann::json item_to_json(const QueueItem& item);
nlohmann::json statistics_to_json(const QueueStatistics& stats);
nlohmann::json bandwidth_to_json(const monitor::BandwidthSnapshot& snapshot);
nlohmann::json resource_to_json(const monitor::ResourceUsage& usage);

// Milliseconds since the Unix epoch
std::int64_t to_epoch_ms(Clock::time_point time);

} // namespace upq::queue
