#include "cache/redis_cache.h"
#include "config.h"
#include "download_service.h"
#include "market_data_client.h"
#include "redis_bus.h"
#include "service.h"
#include "storage/pg_blob_store.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <algorithm>
#include <csignal>
#include <string>
#include <thread>
#include <vector>

namespace {

sde::Service* g_service = nullptr;

constexpr std::array<const char*, 4> RUN_MODES = {"once", "service", "listener", "both"};

struct CommandLine {
    std::string config_path = "config.json";
    std::string mode;                     // empty: keep the configured mode
    std::vector<std::string> symbols;     // "once" only; empty means every known symbol
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            cl.config_path = argv[++i];
        } else if (arg.rfind("--mode=", 0) == 0) {
            cl.mode = arg.substr(7);
        } else if (arg == "--mode" && has_value) {
            cl.mode = argv[++i];
        } else if (arg == "--symbol" && has_value) {
            cl.symbols.emplace_back(argv[++i]);
        } else {
            spdlog::warn("Ignoring argument: {}", arg);
        }
    }
    return cl;
}

void handle_shutdown_signal(int sig) {
    spdlog::info("Received signal {}, shutting down...", sig);
    if (g_service) g_service->stop();
}

void configure_logging(const std::string& level_name) {
    spdlog::set_default_logger(spdlog::stdout_color_mt("stock-data-engine"));

    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CommandLine cl = parse_command_line(argc, argv);

    sde::Config config = sde::Config::load(cl.config_path);
    if (!cl.mode.empty()) config.service.mode = cl.mode;

    configure_logging(config.service.log_level);

    const std::string& mode = config.service.mode;
    if (std::find(RUN_MODES.begin(), RUN_MODES.end(), mode) == RUN_MODES.end()) {
        spdlog::error("Unknown mode '{}' (expected once, service, listener or both)", mode);
        return 2;
    }
    spdlog::info("stock-data-engine v1.0.0 starting (mode={})", mode);

    std::signal(SIGINT, handle_shutdown_signal);
    std::signal(SIGTERM, handle_shutdown_signal);

    try {
        sde::PgBlobStore store(config.database);
        if (!store.health_check()) {
            spdlog::error("Blob store health check failed");
            return 1;
        }

        sde::RedisCache cache(config.redis);
        sde::RedisBus bus(config.redis);
        if (!bus.health_check()) {
            spdlog::warn("Redis not answering PING; cache and events are degraded");
        }

        sde::MarketDataClient provider(config.market_data);
        if (!provider.health_check()) {
            spdlog::warn("Market data provider at {} not reachable yet", config.market_data.target);
        }

        sde::DownloadService downloads(config, provider, store, cache);
        sde::Service service(config, downloads, bus);
        g_service = &service;

        int rc = 0;
        if (mode == "once") {
            rc = service.run_once(cl.symbols).failed() > 0 ? 1 : 0;
        } else if (mode == "service") {
            service.run_service_loop();
        } else if (mode == "listener") {
            service.run_listener();
        } else {
            std::thread loop([&service] { service.run_service_loop(); });
            service.run_listener();

            // The listener also returns on a read error; take the loop down with it
            service.stop();
            loop.join();
        }

        g_service = nullptr;
        spdlog::info("stock-data-engine shut down cleanly");
        return rc;

    } catch (const std::exception& e) {
        g_service = nullptr;
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
