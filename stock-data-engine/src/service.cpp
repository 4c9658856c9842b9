#include "service.h"
#include "errors.h"
#include "storage/storage_paths.h"

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

namespace sde {

namespace {

// Granularity of the interruptible sleep between service passes.
constexpr auto SLEEP_SLICE = std::chrono::seconds(1);

} // anonymous namespace

Service::Service(const Config& config, DownloadService& downloads, RedisBus& redis)
    : config_(config), downloads_(downloads), redis_(redis) {}


std::vector<std::string> Service::symbols_to_update() {
    std::vector<std::string> symbols;
    for (const auto& s : downloads_.catalog().load().symbols) symbols.push_back(s.symbol);
    for (const auto& s : config_.service.symbols) symbols.push_back(normalize_symbol(s));

    std::sort(symbols.begin(), symbols.end());
    symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());
    symbols.erase(std::remove(symbols.begin(), symbols.end(), std::string()), symbols.end());
    return symbols;
}


BulkResult Service::run_once(const std::vector<std::string>& symbols) {
    auto start = std::chrono::steady_clock::now();
    auto targets = symbols.empty() ? symbols_to_update() : symbols;
    spdlog::info("Updating {} symbols", targets.size());

    BulkResult bulk = downloads_.download_bulk(targets, DownloadService::BulkMode::Incremental);

    int new_points = 0, unchanged = 0;
    for (const auto& r : bulk.results) {
        new_points += r.new_points;
        if (r.status == SyncResult::Status::NoNewData) unchanged++;
        if (!r.ok()) spdlog::warn("{}: {} ({})", r.symbol, status_name(r.status), r.message);
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Update pass complete: {} ok, {} failed, {} unchanged, {} new points, {}ms",
                 bulk.succeeded(), bulk.failed(), unchanged, new_points, ms);
    return bulk;
}


void Service::run_service_loop() {
    spdlog::info("Service loop started (interval={}min)", config_.service.interval_minutes);
    auto interval = std::chrono::minutes(config_.service.interval_minutes);

    while (running_) {
        auto start = std::chrono::steady_clock::now();

        try {
            run_once();
        } catch (const std::exception& e) {
            spdlog::error("Service loop error: {}", e.what());
        }

        // Sleep for the remaining interval, waking early on stop()
        auto deadline = start + interval;
        while (running_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(SLEEP_SLICE);
        }
    }

    spdlog::info("Service loop stopped");
}


void Service::run_listener() {
    spdlog::info("Listener started on channel: {}", redis_.channel_for("download_request"));

    redis_.listen(
        "download_request",
        [this](const BusEvent& request) {
            if (!running_) return;
            try {
                handle_download_request(request);
            } catch (const std::exception& e) {
                spdlog::error("Error handling download request {}: {}", request.correlation_id, e.what());
            }
        },
        [this] { return running_.load(); });
}


void Service::stop() {
    running_ = false;
}


void Service::handle_download_request(const BusEvent& request) {
    const std::string& correlation_id = request.correlation_id;

    DownloadRequest req;
    try {
        req = DownloadRequest::from_json(request.payload);
    } catch (const ValidationError& e) {
        spdlog::warn("Rejecting download request {}: {}", correlation_id, e.what());
        SyncResult result;
        if (request.payload.is_object() && request.payload.contains("symbol") &&
            request.payload["symbol"].is_string()) {
            result.symbol = normalize_symbol(request.payload["symbol"].get<std::string>());
        }
        result.status = SyncResult::Status::Error;
        result.message = e.what();
        publish_result("download_failed", result, correlation_id);
        return;
    }

    spdlog::info("Handling download request: symbol={}, mode={}, correlation_id={}",
                 req.symbol, req.mode, correlation_id);

    SyncResult result;
    result.symbol = req.symbol;

    if (req.symbol.empty()) {
        result.status = SyncResult::Status::Error;
        result.message = "missing symbol";
    } else if (req.mode == "full") {
        try {
            result = downloads_.download_full(req.symbol, req.start_date, req.end_date);
        } catch (const std::invalid_argument& e) {
            result.status = SyncResult::Status::Error;
            result.message = e.what();
        }
    } else if (req.mode == "incremental") {
        result = downloads_.update_incremental(req.symbol);
    } else if (req.mode == "weekly") {
        result = downloads_.sync_weekly(req.symbol, req.force);
    } else if (req.mode == "delete") {
        result = downloads_.delete_symbol(req.symbol);
    } else {
        result.status = SyncResult::Status::Error;
        result.message = "unknown mode: " + req.mode;
    }

    publish_result(result.ok() ? "download_complete" : "download_failed", result, correlation_id);

    spdlog::info("Download request done: symbol={}, status={}, new_points={}",
                 req.symbol, status_name(result.status), result.new_points);
}


void Service::publish_result(const std::string& event_type, const SyncResult& result,
                             const std::string& correlation_id)
{
    BusEvent ev;
    ev.event_type = event_type;
    ev.payload = result.to_json();
    ev.source = "stock-data-engine";
    ev.correlation_id = correlation_id;

    if (!redis_.publish_event(ev)) {
        spdlog::warn("Could not publish {} for {}", event_type, result.symbol);
    }
}

} // namespace sde
