#include "upq/queue/scheduler.hpp"

#include "upq/queue/admission.hpp"
#include "upq/queue/chunk_planner.hpp"
#include "upq/queue/error_classifier.hpp"
#include "upq/queue/item_state.hpp"
#include "upq/queue/serializer.hpp"
#include "upq/queue/statistics.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace upq::queue {

using events::QueueEventType;
using json = nlohmann::json;

namespace {

constexpr double kMaxUploadingProgress = 99.9;

std::size_t worker_count(const QueueConfig& config) {
    return std::max<std::size_t>(2, static_cast<std::size_t>(config.max_concurrent_uploads) * 2);
}

std::chrono::milliseconds watchdog_interval(const QueueConfig& config) {
    const auto quarter = config.timeout_duration / 4;
    return std::clamp(quarter, std::chrono::milliseconds{5}, std::chrono::milliseconds{1000});
}

const QueueConfig& checked(const QueueConfig& config) {
    if (auto valid = validate_config(config); valid.is_error()) {
        throw std::invalid_argument("Invalid queue configuration: " + valid.error());
    }
    return config;
}

std::uint64_t confirmed_chunk_bytes(const QueueItem& item) {
    std::uint64_t bytes = 0;
    for (const auto& chunk : item.chunks) {
        if (chunk.status == ChunkStatus::Completed) {
            bytes += chunk.size;
        }
    }
    return bytes;
}

double progress_of(std::uint64_t uploaded, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(uploaded) / static_cast<double>(total) * 100.0;
}

} // namespace

/// Routes executor callbacks for one dispatch back into the scheduler.
class UploadScheduler::ItemObserver : public transfer::TransferObserver {
public:
    ItemObserver(UploadScheduler& scheduler, std::string id, std::uint64_t attempt)
        : scheduler_(scheduler), id_(std::move(id)), attempt_(attempt) {}

    void on_progress(std::uint64_t uploaded_bytes, std::chrono::milliseconds elapsed) override {
        scheduler_.on_progress(id_, attempt_, uploaded_bytes, elapsed);
    }

    void on_chunk_update(const UploadChunk& chunk) override {
        scheduler_.on_chunk_update(id_, attempt_, chunk);
    }

    void on_finalizing() override {
        scheduler_.on_finalizing(id_, attempt_);
    }

private:
    UploadScheduler& scheduler_;
    std::string id_;
    std::uint64_t attempt_;
};

UploadScheduler::UploadScheduler(QueueConfig config, transfer::Transport& transport, events::EventBus& bus)
    : config_(checked(config)),
      bus_(bus),
      executor_(transport),
      bandwidth_(config_.bandwidth_window,
                 config_.enable_bandwidth_throttling,
                 config_.max_bandwidth),
      io_(),
      work_guard_(boost::asio::make_work_guard(io_)),
      bandwidth_timer_(io_),
      resource_timer_(io_),
      watchdog_timer_(io_),
      workers_(worker_count(config_)) {
    arm_bandwidth_timer();
    arm_resource_timer();
    arm_watchdog_timer();

    io_thread_ = std::thread([this]() { io_.run(); });
    admission_thread_ = std::thread([this]() { admission_loop(); });
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });

    spdlog::info("[Scheduler] started max_concurrent={} max_retries={} retry_delay={}ms timeout={}ms",
                 config_.max_concurrent_uploads, config_.max_retries,
                 config_.retry_delay.count(), config_.timeout_duration.count());
}

UploadScheduler::~UploadScheduler() {
    stopping_ = true;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, active] : active_) {
            active.token.cancel(CancelReason::Shutdown);
        }
        active_.clear();
        for (auto& [id, timer] : retry_timers_) {
            timer->cancel();
        }
        retry_timers_.clear();
    }

    wake_channel_.shutdown();
    if (admission_thread_.joinable()) {
        admission_thread_.join();
    }

    work_guard_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    workers_.join();

    // Deliver whatever was published before shutdown
    event_channel_.shutdown();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    spdlog::info("[Scheduler] stopped");
}

// ════════════════════════════════════════════════════════
// Enqueue
// ════════════════════════════════════════════════════════

std::vector<std::string> UploadScheduler::add_to_queue(const std::vector<FileSource>& files,
                                                       const std::string& session_id,
                                                       Priority priority,
                                                       const std::optional<TransferStrategy>& strategy) {
    std::vector<std::string> ids;
    EventList events;
    {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();
        for (const auto& file : files) {
            QueueItem item;
            item.id = "upload-" + std::to_string(++item_counter_);
            item.session_id = session_id;
            item.file = file;
            item.priority = priority;
            item.total_bytes = file.size;
            item.strategy = strategy ? *strategy : default_strategy(file.size);
            item.sequence = item_counter_;
            item.added_at = now;
            item.metadata = {{"addedAt", to_epoch_ms(now)},
                             {"filename", file.name},
                             {"mimeType", file.mime_type}};

            if (const auto* params = std::get_if<ChunkedParams>(&item.strategy.params)) {
                auto plan = plan_chunks(file.size, params->chunk_size);
                if (plan.is_ok()) {
                    item.chunks = std::move(plan.value());
                } else {
                    // Left empty: the executor rejects the plan as a validation failure
                    spdlog::warn("[Scheduler] cannot plan chunks for {}: {}", file.name, plan.error());
                }
            }

            events.push_back(make_event(QueueEventType::FileAdded, item,
                                        {{"filename", file.name},
                                         {"size", file.size},
                                         {"priority", to_string(priority)},
                                         {"strategy", item.strategy.id}}));
            ids.push_back(item.id);
            items_.push_back(std::move(item));
        }
        publish_locked(events);
    }

    if (!ids.empty()) {
        wake(WakeReason::Enqueued);
    }
    return ids;
}

// ════════════════════════════════════════════════════════
// Control
// ════════════════════════════════════════════════════════

upq::Result<void> UploadScheduler::pause(const std::string& id) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        auto* item = find_locked(id);
        if (item == nullptr) {
            return upq::Err<void>("Unknown item " + id);
        }
        if (item->status != ItemStatus::Uploading) {
            spdlog::warn("[Scheduler] pause rejected for {} in status {}", id, to_string(item->status));
            return upq::Err<void>("Cannot pause item " + id + " in status " + to_string(item->status));
        }
        pause_locked(*item, "user", events);
        publish_locked(events);
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

upq::Result<void> UploadScheduler::resume(const std::string& id) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        auto* item = find_locked(id);
        if (item == nullptr) {
            return upq::Err<void>("Unknown item " + id);
        }
        if (item->status != ItemStatus::Paused) {
            spdlog::warn("[Scheduler] resume rejected for {} in status {}", id, to_string(item->status));
            return upq::Err<void>("Cannot resume item " + id + " in status " + to_string(item->status));
        }
        requeue_paused_locked(*item, "user", events);
        publish_locked(events);
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

upq::Result<void> UploadScheduler::cancel(const std::string& id) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        auto* item = find_locked(id);
        if (item == nullptr) {
            return upq::Err<void>("Unknown item " + id);
        }
        if (is_terminal(item->status)) {
            spdlog::warn("[Scheduler] cancel rejected for {} in status {}", id, to_string(item->status));
            return upq::Err<void>("Cannot cancel item " + id + " in status " + to_string(item->status));
        }

        const auto previous = item->status;
        abort_locked(*item, CancelReason::Cancelled);
        cancel_retry_locked(id);
        paused_.erase(id);
        if (auto moved = transition(*item, ItemStatus::Cancelled); moved.is_error()) {
            return moved;
        }
        events.push_back(make_event(QueueEventType::Cancelled, *item, {{"previousStatus", to_string(previous)}}));
        publish_locked(events);
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

upq::Result<void> UploadScheduler::retry(const std::string& id) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        auto* item = find_locked(id);
        if (item == nullptr) {
            return upq::Err<void>("Unknown item " + id);
        }
        if (item->status != ItemStatus::Failed) {
            spdlog::warn("[Scheduler] retry rejected for {} in status {}", id, to_string(item->status));
            return upq::Err<void>("Cannot retry item " + id + " in status " + to_string(item->status));
        }

        cancel_retry_locked(id);
        item->retry_count = 0;
        if (auto moved = transition(*item, ItemStatus::Queued); moved.is_error()) {
            return moved;
        }
        events.push_back(make_event(QueueEventType::Resumed, *item,
                                    {{"reason", "retry"}, {"previousErrors", item->errors.size()}}));
        publish_locked(events);
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

upq::Result<void> UploadScheduler::change_priority(const std::string& id, Priority priority) {
    {
        std::lock_guard lock(mutex_);
        auto* item = find_locked(id);
        if (item == nullptr) {
            return upq::Err<void>("Unknown item " + id);
        }
        if (item->status != ItemStatus::Queued && item->status != ItemStatus::Paused) {
            spdlog::warn("[Scheduler] priority change rejected for {} in status {}", id, to_string(item->status));
            return upq::Err<void>("Cannot change priority of item " + id + " in status " + to_string(item->status));
        }
        spdlog::info("[Scheduler] item={} priority {} -> {}", id, to_string(item->priority), to_string(priority));
        item->priority = priority;
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

upq::Result<void> UploadScheduler::remove_from_queue(const std::string& id) {
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(items_.begin(), items_.end(), [&id](const QueueItem& item) { return item.id == id; });
        if (it == items_.end()) {
            return upq::Err<void>("Unknown item " + id);
        }
        abort_locked(*it, CancelReason::Cancelled);
        cancel_retry_locked(id);
        retry_generation_.erase(id);
        paused_.erase(id);
        spdlog::info("[Scheduler] removed item={} status={}", id, to_string(it->status));
        items_.erase(it);
    }
    wake(WakeReason::Control);
    return upq::Ok();
}

void UploadScheduler::pause_all() {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        global_paused_ = true;
        for (auto& item : items_) {
            if (item.status == ItemStatus::Uploading) {
                pause_locked(item, "pause-all", events);
            }
        }
        publish_locked(events);
    }
    spdlog::info("[Scheduler] paused all ({} transfer(s) stopped)", events.size());
}

void UploadScheduler::resume_all() {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        global_paused_ = false;
        const std::vector<std::string> paused(paused_.begin(), paused_.end());
        for (const auto& id : paused) {
            if (auto* item = find_locked(id); item != nullptr && item->status == ItemStatus::Paused) {
                requeue_paused_locked(*item, "resume-all", events);
            }
        }
        publish_locked(events);
    }
    spdlog::info("[Scheduler] resumed all ({} item(s) requeued)", events.size());
    wake(WakeReason::Control);
}

std::size_t UploadScheduler::clear_queue(const std::optional<std::string>& session_id) {
    std::size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto it = items_.begin(); it != items_.end();) {
            if (session_id && it->session_id != *session_id) {
                ++it;
                continue;
            }
            abort_locked(*it, CancelReason::Cancelled);
            cancel_retry_locked(it->id);
            retry_generation_.erase(it->id);
            paused_.erase(it->id);
            it = items_.erase(it);
            ++removed;
        }
    }
    spdlog::info("[Scheduler] cleared {} item(s){}", removed,
                 session_id ? " from session " + *session_id : std::string{});
    if (removed > 0) {
        wake(WakeReason::Control);
    }
    return removed;
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

std::vector<QueueItem> UploadScheduler::get_queue() const {
    std::lock_guard lock(mutex_);
    return items_;
}

std::optional<QueueItem> UploadScheduler::get_queue_item(const std::string& id) const {
    std::lock_guard lock(mutex_);
    if (const auto* item = find_locked(id)) {
        return *item;
    }
    return std::nullopt;
}

QueueStatistics UploadScheduler::get_statistics() const {
    std::lock_guard lock(mutex_);
    return compute_statistics(items_);
}

monitor::BandwidthSnapshot UploadScheduler::get_bandwidth_monitor() const {
    return bandwidth_.snapshot();
}

monitor::ResourceUsage UploadScheduler::get_resource_usage() const {
    auto usage = resources_.latest();
    if (usage.sampled_at == std::chrono::system_clock::time_point{}) {
        usage = resources_.sample(bandwidth_.current_speed());
    }
    return usage;
}

bool UploadScheduler::is_paused() const {
    std::lock_guard lock(mutex_);
    return global_paused_;
}

// ════════════════════════════════════════════════════════
// Admission
// ════════════════════════════════════════════════════════

void UploadScheduler::wake(WakeReason reason) {
    if (!stopping_) {
        wake_channel_.push(reason);
    }
}

void UploadScheduler::admission_loop() {
    const auto debounce = config_.admission_debounce;
    const auto burst_limit = std::max(debounce * 10, std::chrono::milliseconds{10});

    while (auto signal = wake_channel_.pop()) {
        // Let the burst settle, but never starve admission under constant churn
        std::size_t coalesced = 1;
        const auto deadline = std::chrono::steady_clock::now() + burst_limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!wake_channel_.pop_for(debounce)) {
                break;
            }
            ++coalesced;
        }
        if (stopping_) {
            break;
        }
        spdlog::trace("[Scheduler] admission pass after {} wake signal(s)", coalesced);
        run_admission();
    }
}

void UploadScheduler::run_admission() {
    std::vector<Dispatch> dispatches;
    EventList events;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || global_paused_) {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        for (const auto& id : select_for_admission(items_, config_)) {
            auto* item = find_locked(id);
            if (item == nullptr) {
                continue;
            }

            // Non-resumable strategies start over; resumable chunked uploads keep confirmed chunks
            const bool resumes = item->strategy.type() == StrategyType::Chunked && item->strategy.resumable();
            if (!resumes) {
                for (auto& chunk : item->chunks) {
                    chunk.status = ChunkStatus::Pending;
                    chunk.completed_at.reset();
                }
            }
            item->uploaded_bytes = resumes ? confirmed_chunk_bytes(*item) : 0;
            item->progress = std::min(kMaxUploadingProgress, progress_of(item->uploaded_bytes, item->total_bytes));

            if (auto moved = transition(*item, ItemStatus::Uploading); moved.is_error()) {
                spdlog::error("[Scheduler] {}", moved.error());
                continue;
            }

            ActiveTransfer active;
            active.attempt = ++attempt_counter_;
            active.last_activity = now;
            active.last_bytes = item->uploaded_bytes;
            active_[id] = active;

            dispatches.push_back(Dispatch{active.attempt, active.token, build_request(*item)});
            events.push_back(make_event(QueueEventType::UploadStarted, *item,
                                        {{"attempt", item->retry_count + 1},
                                         {"strategy", item->strategy.id},
                                         {"resumedFromBytes", item->uploaded_bytes}}));
        }
        publish_locked(events);
    }

    for (auto& dispatch : dispatches) {
        boost::asio::post(workers_, [this, dispatch = std::move(dispatch)]() { run_transfer(dispatch); });
    }
}

void UploadScheduler::run_transfer(const Dispatch& dispatch) {
    const auto& id = dispatch.request.item_id;
    ItemObserver observer(*this, id, dispatch.attempt);
    const auto result = executor_.execute(dispatch.request, observer, dispatch.token);
    on_finished(id, dispatch.attempt, result);
}

// ════════════════════════════════════════════════════════
// Executor callbacks
// ════════════════════════════════════════════════════════

void UploadScheduler::on_progress(const std::string& id, std::uint64_t attempt,
                                  std::uint64_t uploaded_bytes, std::chrono::milliseconds elapsed) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        auto* active = current_attempt_locked(id, attempt);
        auto* item = active ? find_locked(id) : nullptr;
        if (item == nullptr || item->status != ItemStatus::Uploading) {
            return;
        }

        active->last_activity = std::chrono::steady_clock::now();
        uploaded_bytes = std::min(uploaded_bytes, item->total_bytes);
        if (uploaded_bytes <= item->uploaded_bytes) {
            return;
        }

        const auto dt = elapsed - active->last_elapsed;
        if (dt.count() > 0) {
            const auto delta = static_cast<double>(uploaded_bytes - active->last_bytes);
            item->speed = delta / std::chrono::duration<double>(dt).count();
            active->last_bytes = uploaded_bytes;
            active->last_elapsed = elapsed;
        }

        item->uploaded_bytes = uploaded_bytes;
        item->progress = std::min(kMaxUploadingProgress, progress_of(uploaded_bytes, item->total_bytes));
        if (item->speed > 0.0) {
            const auto remaining = static_cast<double>(item->total_bytes - uploaded_bytes);
            item->time_remaining = std::chrono::milliseconds{static_cast<std::int64_t>(remaining / item->speed * 1000.0)};
        } else {
            item->time_remaining.reset();
        }

        events.push_back(make_event(QueueEventType::ProgressUpdated, *item,
                                    {{"progress", item->progress},
                                     {"uploadedBytes", item->uploaded_bytes},
                                     {"totalBytes", item->total_bytes},
                                     {"speed", item->speed},
                                     {"timeRemaining", item->time_remaining ? json(item->time_remaining->count())
                                                                            : json(nullptr)}}));
        publish_locked(events);
    }
}

void UploadScheduler::on_chunk_update(const std::string& id, std::uint64_t attempt, const UploadChunk& chunk) {
    std::lock_guard lock(mutex_);
    auto* active = current_attempt_locked(id, attempt);
    auto* item = active ? find_locked(id) : nullptr;
    if (item == nullptr || chunk.index >= item->chunks.size()) {
        return;
    }
    active->last_activity = std::chrono::steady_clock::now();
    item->chunks[chunk.index] = chunk;
}

void UploadScheduler::on_finalizing(const std::string& id, std::uint64_t attempt) {
    std::lock_guard lock(mutex_);
    auto* active = current_attempt_locked(id, attempt);
    auto* item = active ? find_locked(id) : nullptr;
    if (item == nullptr) {
        return;
    }
    active->last_activity = std::chrono::steady_clock::now();
    if (auto moved = transition(*item, ItemStatus::Processing); moved.is_error()) {
        spdlog::error("[Scheduler] {}", moved.error());
        return;
    }
    spdlog::debug("[Scheduler] item={} finalizing {} chunk(s)", id, item->chunks.size());
}

void UploadScheduler::on_finished(const std::string& id, std::uint64_t attempt,
                                  const transfer::TransportResult& result) {
    EventList events;
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || current_attempt_locked(id, attempt) == nullptr) {
            // Paused, cancelled, timed out or removed while in flight
            spdlog::debug("[Scheduler] dropping result of stale attempt {} for {}", attempt, id);
            return;
        }
        active_.erase(id);

        auto* item = find_locked(id);
        if (item == nullptr) {
            return;
        }

        if (result.is_ok()) {
            if (auto moved = transition(*item, ItemStatus::Completed); moved.is_error()) {
                spdlog::error("[Scheduler] {}", moved.error());
            } else {
                const auto duration = item->started_at
                    ? std::chrono::duration_cast<std::chrono::milliseconds>(*item->completed_at - *item->started_at)
                    : std::chrono::milliseconds{0};
                events.push_back(make_event(QueueEventType::Completed, *item,
                                            {{"totalBytes", item->total_bytes},
                                             {"durationMs", duration.count()},
                                             {"response", result.value().body}}));
            }
        } else {
            fail_locked(*item, result.error(), events);
        }
        publish_locked(events);
    }
    wake(WakeReason::Finished);
}

// ════════════════════════════════════════════════════════
// Failure and retry
// ════════════════════════════════════════════════════════

void UploadScheduler::fail_locked(QueueItem& item, const transfer::TransportError& error, EventList& events) {
    const auto queue_error = make_queue_error(error);
    item.errors.push_back(queue_error);

    if (auto moved = transition(item, ItemStatus::Failed); moved.is_error()) {
        spdlog::error("[Scheduler] {}", moved.error());
        return;
    }

    json data = {{"error", error_to_json(queue_error)}, {"retryCount", item.retry_count}};
    if (should_retry(queue_error, item.retry_count + 1, config_.max_retries)) {
        const auto delay = backoff_delay(config_.retry_delay, item.retry_count);
        schedule_retry_locked(item.id, delay);
        data["willRetry"] = true;
        data["retryDelayMs"] = delay.count();
    } else {
        data["willRetry"] = false;
    }
    events.push_back(make_event(QueueEventType::Failed, item, std::move(data)));
}

void UploadScheduler::schedule_retry_locked(const std::string& id, std::chrono::milliseconds delay) {
    const auto generation = ++retry_generation_[id];
    auto timer = std::make_shared<boost::asio::steady_timer>(io_, delay);
    retry_timers_[id] = timer;
    timer->async_wait([this, id, generation, timer](const boost::system::error_code& ec) {
        if (!ec) {
            on_retry_due(id, generation);
        }
    });
}

void UploadScheduler::on_retry_due(const std::string& id, std::uint64_t generation) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        const auto gen = retry_generation_.find(id);
        if (gen == retry_generation_.end() || gen->second != generation) {
            return;
        }
        retry_timers_.erase(id);

        auto* item = find_locked(id);
        if (item == nullptr || item->status != ItemStatus::Failed) {
            return;
        }
        item->retry_count++;
        if (auto moved = transition(*item, ItemStatus::Queued); moved.is_error()) {
            spdlog::error("[Scheduler] {}", moved.error());
            return;
        }
        spdlog::info("[Scheduler] item={} requeued for retry {}", id, item->retry_count);
    }
    wake(WakeReason::RetryDue);
}

void UploadScheduler::cancel_retry_locked(const std::string& id) {
    auto gen = retry_generation_.find(id);
    if (gen != retry_generation_.end()) {
        ++gen->second;
    }
    auto timer = retry_timers_.find(id);
    if (timer != retry_timers_.end()) {
        timer->second->cancel();
        retry_timers_.erase(timer);
    }
}

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

QueueItem* UploadScheduler::find_locked(const std::string& id) {
    auto it = std::find_if(items_.begin(), items_.end(), [&id](const QueueItem& item) { return item.id == id; });
    return it != items_.end() ? &*it : nullptr;
}

const QueueItem* UploadScheduler::find_locked(const std::string& id) const {
    auto it = std::find_if(items_.begin(), items_.end(), [&id](const QueueItem& item) { return item.id == id; });
    return it != items_.end() ? &*it : nullptr;
}

UploadScheduler::ActiveTransfer* UploadScheduler::current_attempt_locked(const std::string& id,
                                                                         std::uint64_t attempt) {
    auto it = active_.find(id);
    if (it == active_.end() || it->second.attempt != attempt) {
        return nullptr;
    }
    return &it->second;
}

void UploadScheduler::abort_locked(QueueItem& item, CancelReason reason) {
    auto it = active_.find(item.id);
    if (it != active_.end()) {
        it->second.token.cancel(reason);
        active_.erase(it);
    }
    for (auto& chunk : item.chunks) {
        if (chunk.status == ChunkStatus::Uploading) {
            chunk.status = ChunkStatus::Pending;
        }
    }
}

void UploadScheduler::pause_locked(QueueItem& item, const char* reason, EventList& events) {
    abort_locked(item, CancelReason::Paused);
    if (auto moved = transition(item, ItemStatus::Paused); moved.is_error()) {
        spdlog::error("[Scheduler] {}", moved.error());
        return;
    }
    paused_.insert(item.id);
    events.push_back(make_event(QueueEventType::Paused, item,
                                {{"reason", reason}, {"uploadedBytes", item.uploaded_bytes}}));
}

void UploadScheduler::requeue_paused_locked(QueueItem& item, const char* reason, EventList& events) {
    if (auto moved = transition(item, ItemStatus::Queued); moved.is_error()) {
        spdlog::error("[Scheduler] {}", moved.error());
        return;
    }
    paused_.erase(item.id);
    events.push_back(make_event(QueueEventType::Resumed, item, {{"reason", reason}}));
}

TransferStrategy UploadScheduler::default_strategy(std::uint64_t size) const {
    if (size > config_.chunked_threshold) {
        ChunkedParams params;
        params.chunk_size = config_.chunk_size;
        params.max_retries = config_.max_retries;
        params.retry_delay = config_.retry_delay;
        return TransferStrategy::chunked(params);
    }
    return TransferStrategy::single();
}

transfer::TransferRequest UploadScheduler::build_request(const QueueItem& item) const {
    transfer::TransferRequest request;
    request.item_id = item.id;
    request.session_id = item.session_id;
    request.file = item.file;
    request.total_bytes = item.total_bytes;
    request.strategy = item.strategy;
    request.chunks = item.chunks;
    request.metadata = item.metadata;
    return request;
}

events::UploadQueueEvent UploadScheduler::make_event(QueueEventType type, const QueueItem& item, json data) const {
    events::UploadQueueEvent event;
    event.type = type;
    event.session_id = item.session_id;
    event.item_id = item.id;
    event.data = std::move(data);
    return event;
}

void UploadScheduler::publish_locked(const EventList& events) {
    // Queued under mutex_ so subscribers see events in state-change order
    for (const auto& event : events) {
        event_channel_.push(event);
    }
}

void UploadScheduler::dispatch_loop() {
    while (auto event = event_channel_.pop()) {
        bus_.emit(*event);
    }
}

// ════════════════════════════════════════════════════════
// Timers
// ════════════════════════════════════════════════════════

void UploadScheduler::arm_bandwidth_timer() {
    bandwidth_timer_.expires_after(config_.bandwidth_sample_interval);
    bandwidth_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping_) {
            return;
        }
        sample_bandwidth();
        arm_bandwidth_timer();
    });
}

void UploadScheduler::arm_resource_timer() {
    resource_timer_.expires_after(config_.resource_sample_interval);
    resource_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping_) {
            return;
        }
        const auto usage = resources_.sample(bandwidth_.current_speed());
        spdlog::debug("[Resources] cpu={:.1f}% rss={} bandwidth={:.0f}B/s",
                      usage.cpu_usage, usage.memory_usage, usage.network_bandwidth);
        arm_resource_timer();
    });
}

void UploadScheduler::arm_watchdog_timer() {
    watchdog_timer_.expires_after(watchdog_interval(config_));
    watchdog_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping_) {
            return;
        }
        check_timeouts();
        arm_watchdog_timer();
    });
}

void UploadScheduler::sample_bandwidth() {
    double aggregate = 0.0;
    {
        std::lock_guard lock(mutex_);
        for (const auto& item : items_) {
            if (is_active(item.status)) {
                aggregate += item.speed;
            }
        }
    }
    bandwidth_.record(aggregate, config_.bandwidth_sample_interval);
    if (bandwidth_.throttled()) {
        spdlog::warn("[Bandwidth] {:.0f}B/s exceeds the configured cap", aggregate);
    }
}

void UploadScheduler::check_timeouts() {
    EventList events;
    std::size_t timed_out = 0;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        std::vector<std::string> stalled;
        for (const auto& [id, active] : active_) {
            if (now - active.last_activity >= config_.timeout_duration) {
                stalled.push_back(id);
            }
        }

        for (const auto& id : stalled) {
            auto* item = find_locked(id);
            if (item == nullptr) {
                active_.erase(id);
                continue;
            }
            spdlog::warn("[Scheduler] item={} made no progress for {}ms", id, config_.timeout_duration.count());
            abort_locked(*item, CancelReason::TimedOut);
            auto error = transfer::TransportError::timeout(
                "No progress for " + std::to_string(config_.timeout_duration.count()) + "ms");
            fail_locked(*item, error, events);
            ++timed_out;
        }
        publish_locked(events);
    }
    if (timed_out > 0) {
        wake(WakeReason::Finished);
    }
}

} // namespace upq::queue
