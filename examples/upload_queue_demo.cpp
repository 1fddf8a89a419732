#include "upq/events/components.hpp"
#include "upq/events/event_bus.hpp"
#include "upq/queue/admission.hpp"
#include "upq/queue/config.hpp"
#include "upq/queue/item_state.hpp"
#include "upq/queue/scheduler.hpp"
#include "upq/queue/serializer.hpp"
#include "upq/transfer/simulated_transport.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using upq::queue::FileSource;
using upq::queue::Priority;
using upq::queue::QueueConfig;
using upq::queue::UploadScheduler;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string guess_mime_type(const fs::path& path) {
    const auto ext = path.extension().string();
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".txt" || ext == ".log") return "text/plain";
    if (ext == ".json") return "application/json";
    if (ext == ".zip") return "application/zip";
    if (ext == ".mp4") return "video/mp4";
    return "application/octet-stream";
}

std::optional<FileSource> file_from_path(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        spdlog::warn("Skipping {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    FileSource file;
    file.name = path.filename().string();
    file.size = size;
    file.mime_type = guess_mime_type(path);
    file.path = path;
    return file;
}

std::vector<FileSource> synthetic_files() {
    return {
        {"resume-anna.pdf", 2 * 1024 * 1024, "application/pdf", {}},
        {"interview-recording.mp4", 24 * 1024 * 1024, "video/mp4", {}},
        {"cover-letter.txt", 48 * 1024, "text/plain", {}},
        {"portfolio.zip", 6 * 1024 * 1024, "application/zip", {}},
    };
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [files...]\n"
              << "  -c, --config <path>      JSON queue configuration\n"
              << "  -s, --session <id>       session id (default: demo-session)\n"
              << "  -p, --priority <tier>    urgent | high | normal | low (default: normal)\n"
              << "  -r, --rate <bytes/s>     simulated throughput (default: 4 MiB/s)\n"
              << "  -f, --failure-rate <p>   probability a transfer call fails (default: 0)\n"
              << "  -t, --max-wait <s>       give up after this many seconds (default: 120)\n"
              << "  -v, --verbose            debug logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::string session_id = "demo-session";
    Priority priority = Priority::Normal;
    upq::transfer::SimulatedTransport::Options transport_options;
    std::chrono::seconds max_wait{120};
    std::vector<fs::path> paths;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-s" || arg == "--session") && i + 1 < argc) {
            session_id = argv[++i];
        } else if ((arg == "-p" || arg == "--priority") && i + 1 < argc) {
            const auto parsed = upq::queue::priority_from_string(argv[++i]);
            if (!parsed) {
                spdlog::error("Unknown priority '{}'", argv[i]);
                return 1;
            }
            priority = *parsed;
        } else if ((arg == "-r" || arg == "--rate") && i + 1 < argc) {
            transport_options.bytes_per_second = std::stod(argv[++i]);
        } else if ((arg == "-f" || arg == "--failure-rate") && i + 1 < argc) {
            transport_options.failure_rate = std::stod(argv[++i]);
        } else if ((arg == "-t" || arg == "--max-wait") && i + 1 < argc) {
            max_wait = std::chrono::seconds{std::stoll(argv[++i])};
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            paths.emplace_back(arg);
        }
    }

    QueueConfig config;
    if (config_path) {
        auto loaded = upq::queue::load_queue_config(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 1;
        }
        config = loaded.value();
    }

    std::vector<FileSource> files;
    for (const auto& path : paths) {
        if (auto file = file_from_path(path)) {
            files.push_back(*file);
        }
    }
    if (files.empty()) {
        spdlog::info("No readable files given, uploading synthetic files");
        files = synthetic_files();
    }

    upq::events::EventBus event_bus;
    upq::events::LoggerComponent logger(event_bus);
    upq::events::MetricsComponent metrics(event_bus);
    upq::transfer::SimulatedTransport transport(transport_options);

    json report;
    {
        UploadScheduler scheduler(config, transport, event_bus);
        const auto ids = scheduler.add_to_queue(files, session_id, priority);
        spdlog::info("Queued {} file(s) for session {}", ids.size(), session_id);

        // Settled once every item is terminal or failed without a pending retry
        const auto settled = [&scheduler](const upq::queue::QueueItem& item) {
            if (upq::queue::is_terminal(item.status)) {
                return true;
            }
            return item.status == upq::queue::ItemStatus::Failed && !item.errors.empty() &&
                   !upq::queue::should_retry(item.errors.back(), item.retry_count + 1,
                                             scheduler.config().max_retries);
        };

        const auto deadline = std::chrono::steady_clock::now() + max_wait;
        while (std::chrono::steady_clock::now() < deadline) {
            const auto queue = scheduler.get_queue();
            if (std::all_of(queue.begin(), queue.end(), settled)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{250});
        }

        report["statistics"] = upq::queue::statistics_to_json(scheduler.get_statistics());
        report["bandwidth"] = upq::queue::bandwidth_to_json(scheduler.get_bandwidth_monitor());
        report["resources"] = upq::queue::resource_to_json(scheduler.get_resource_usage());
        report["items"] = json::array();
        for (const auto& item : scheduler.get_queue()) {
            report["items"].push_back(upq::queue::item_to_json(item));
        }
    }

    const auto& stats = metrics.get_stats();
    report["events"] = {{"filesAdded", stats.files_added.load()},
                        {"uploadsStarted", stats.uploads_started.load()},
                        {"completed", stats.completed.load()},
                        {"failed", stats.failed.load()},
                        {"retriesScheduled", stats.retries_scheduled.load()},
                        {"bytesCompleted", stats.bytes_completed.load()},
                        {"transportCalls", transport.calls()}};

    std::cout << report.dump(2) << std::endl;
    return 0;
}
