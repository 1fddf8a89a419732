#pragma once

/**
 * @file scheduler.hpp
 * @brief Upload queue: admission control, retry/backoff and lifecycle events
 *
 * WHAT IT DOES:
 * - Owns every QueueItem; callers only get copies
 * - Admits queued items up to the global and per-tier concurrency caps,
 *   highest weight first, FIFO inside a tier
 * - Runs each admitted item through its strategy executor on a worker pool
 * - Classifies failures and retries with exponential backoff
 * - Publishes UploadQueueEvents on the EventBus
 * - Samples aggregate bandwidth and process resources on their own timers
 *
 * THREADING MODEL:
 * - Admission thread: pops wake signals from a channel, waits for the
 *   debounce window to go quiet, then runs one admission pass
 * - Worker pool (boost::asio::thread_pool): one executor run per admitted
 *   item; blocking transport calls live here
 * - Timer thread (boost::asio::io_context): bandwidth and resource sampling,
 *   the no-progress watchdog and retry backoff timers
 * - Dispatch thread: delivers UploadQueueEvents to the bus in the order the
 *   state changes happened; events are queued under the item lock and
 *   emitted without it, so handlers may call back into the scheduler
 *
 * EXAMPLE:
 * events::EventBus bus;
 * transfer::SimulatedTransport transport;
 * UploadScheduler scheduler(QueueConfig{}, transport, bus);
 * auto ids = scheduler.add_to_queue(files, "session-1", Priority::High);
 */

#include "upq/core/cancellation.hpp"
#include "upq/core/result.hpp"
#include "upq/events/event_bus.hpp"
#include "upq/events/event_queue.hpp"
#include "upq/events/events.hpp"
#include "upq/monitor/bandwidth_monitor.hpp"
#include "upq/monitor/resource_monitor.hpp"
#include "upq/queue/config.hpp"
#include "upq/queue/types.hpp"
#include "upq/transfer/executors.hpp"
#include "upq/transfer/transport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace upq::queue {

class UploadScheduler {
public:
    /// Throws std::invalid_argument if the configuration does not validate.
    UploadScheduler(QueueConfig config, transfer::Transport& transport, events::EventBus& bus);
    ~UploadScheduler();

    UploadScheduler(const UploadScheduler&) = delete;
    UploadScheduler& operator=(const UploadScheduler&) = delete;

    // ════════════════════════════════════════════════════════
    // Enqueue
    // ════════════════════════════════════════════════════════

    /**
     * @brief Create one queued item per file
     *
     * Without an explicit strategy, files larger than chunked_threshold use
     * the chunked strategy (chunk size, retries and delay from the config),
     * everything else a single-shot upload.
     *
     * RETURNS: item ids in the order of `files`
     */
    std::vector<std::string> add_to_queue(const std::vector<FileSource>& files,
                                          const std::string& session_id,
                                          Priority priority = Priority::Normal,
                                          const std::optional<TransferStrategy>& strategy = std::nullopt);

    // ════════════════════════════════════════════════════════
    // Control
    // ════════════════════════════════════════════════════════

    upq::Result<void> pause(const std::string& id);            // uploading only
    upq::Result<void> resume(const std::string& id);           // paused only
    upq::Result<void> cancel(const std::string& id);           // any non-terminal state
    upq::Result<void> retry(const std::string& id);            // failed only, resets retry_count
    upq::Result<void> change_priority(const std::string& id, Priority priority);  // queued or paused
    upq::Result<void> remove_from_queue(const std::string& id);

    void pause_all();
    void resume_all();

    // Removes every item, or only those of one session. Returns how many went.
    std::size_t clear_queue(const std::optional<std::string>& session_id = std::nullopt);

    // ════════════════════════════════════════════════════════
    // Queries
    // ════════════════════════════════════════════════════════

    [[nodiscard]] std::vector<QueueItem> get_queue() const;
    [[nodiscard]] std::optional<QueueItem> get_queue_item(const std::string& id) const;
    [[nodiscard]] QueueStatistics get_statistics() const;
    [[nodiscard]] monitor::BandwidthSnapshot get_bandwidth_monitor() const;
    [[nodiscard]] monitor::ResourceUsage get_resource_usage() const;

    [[nodiscard]] const QueueConfig& config() const noexcept { return config_; }
    [[nodiscard]] bool is_paused() const;

private:
    enum class WakeReason { Enqueued, Finished, Control, RetryDue };

    struct ActiveTransfer {
        CancellationToken token;
        std::uint64_t attempt = 0;
        std::chrono::steady_clock::time_point last_activity;
        std::uint64_t last_bytes = 0;
        std::chrono::milliseconds last_elapsed{0};
    };

    struct Dispatch {
        std::uint64_t attempt = 0;
        CancellationToken token;
        transfer::TransferRequest request;
    };

    class ItemObserver;
    using EventList = std::vector<events::UploadQueueEvent>;

    // Admission
    void admission_loop();
    void run_admission();
    void run_transfer(const Dispatch& dispatch);
    void wake(WakeReason reason);

    // Executor callbacks, dropped when `attempt` is no longer current
    void on_progress(const std::string& id, std::uint64_t attempt,
                     std::uint64_t uploaded_bytes, std::chrono::milliseconds elapsed);
    void on_chunk_update(const std::string& id, std::uint64_t attempt, const UploadChunk& chunk);
    void on_finalizing(const std::string& id, std::uint64_t attempt);
    void on_finished(const std::string& id, std::uint64_t attempt, const transfer::TransportResult& result);

    // Helpers; *_locked expect mutex_ held
    QueueItem* find_locked(const std::string& id);
    const QueueItem* find_locked(const std::string& id) const;
    ActiveTransfer* current_attempt_locked(const std::string& id, std::uint64_t attempt);
    void abort_locked(QueueItem& item, CancelReason reason);
    void cancel_retry_locked(const std::string& id);
    void fail_locked(QueueItem& item, const transfer::TransportError& error, EventList& events);
    void schedule_retry_locked(const std::string& id, std::chrono::milliseconds delay);
    void pause_locked(QueueItem& item, const char* reason, EventList& events);
    void requeue_paused_locked(QueueItem& item, const char* reason, EventList& events);
    TransferStrategy default_strategy(std::uint64_t size) const;
    transfer::TransferRequest build_request(const QueueItem& item) const;
    events::UploadQueueEvent make_event(events::QueueEventType type, const QueueItem& item,
                                        nlohmann::json data = nlohmann::json::object()) const;
    void publish_locked(const EventList& events);
    void dispatch_loop();

    // Timers
    void on_retry_due(const std::string& id, std::uint64_t generation);
    void arm_bandwidth_timer();
    void arm_resource_timer();
    void arm_watchdog_timer();
    void sample_bandwidth();
    void check_timeouts();

    const QueueConfig config_;
    events::EventBus& bus_;
    transfer::TransferExecutor executor_;

    mutable std::mutex mutex_;
    std::vector<QueueItem> items_;
    std::unordered_map<std::string, ActiveTransfer> active_;
    std::unordered_set<std::string> paused_;
    std::unordered_map<std::string, std::uint64_t> retry_generation_;
    std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> retry_timers_;
    bool global_paused_ = false;
    std::uint64_t item_counter_ = 0;
    std::uint64_t attempt_counter_ = 0;

    monitor::BandwidthMonitor bandwidth_;
    mutable monitor::ResourceMonitor resources_;

    events::ThreadSafeQueue<WakeReason> wake_channel_;
    events::ThreadSafeQueue<events::UploadQueueEvent> event_channel_;
    std::atomic<bool> stopping_{false};

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::steady_timer bandwidth_timer_;
    boost::asio::steady_timer resource_timer_;
    boost::asio::steady_timer watchdog_timer_;
    boost::asio::thread_pool workers_;

    std::thread io_thread_;
    std::thread admission_thread_;
    std::thread dispatch_thread_;
};

} // namespace upq::queue
