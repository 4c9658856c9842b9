#pragma once

#include "config.h"
#include "download_service.h"
#include "redis_bus.h"

#include <atomic>
#include <string>
#include <vector>

namespace sde {

/// Periodic incremental sync plus on-demand download requests over Redis.
class Service {
public:
    Service(const Config& config, DownloadService& downloads, RedisBus& redis);

    /// Run the periodic incremental update loop.
    void run_service_loop();

    /// Run the Redis listener for on-demand requests.
    void run_listener();

    /// One incremental pass over `symbols` (or symbols_to_update() when empty).
    BulkResult run_once(const std::vector<std::string>& symbols = {});

    /// Stop all loops.
    void stop();

    /// Catalog symbols plus configured symbols, normalized and de-duplicated.
    std::vector<std::string> symbols_to_update();

private:
    const Config& config_;
    DownloadService& downloads_;
    RedisBus& redis_;
    std::atomic<bool> running_{true};

    /// Run one download_request and publish download_complete / download_failed.
    void handle_download_request(const BusEvent& request);

    void publish_result(const std::string& event_type, const SyncResult& result,
                        const std::string& correlation_id);
};

} // namespace sde
