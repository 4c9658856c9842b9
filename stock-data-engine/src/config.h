#pragma once

#include "series/merger.h"

#include <string>
#include <vector>

namespace sde {

struct DatabaseConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string dbname = "stockdata";
    std::string user = "stockdata";
    std::string password = "stockdata_dev";
    int connect_timeout_seconds = 10;
    int statement_timeout_ms = 30000;

    std::string connection_string() const;
};

struct RedisConfig {
    std::string host = "localhost";
    int port = 6379;
    std::string channel_prefix = "stockdata";
    bool cache_enabled = true;
    int timeout_ms = 2000;

    // Cache TTL tiers, seconds
    int ttl_latest_price = 300;
    int ttl_recent_data = 3600;
    int ttl_symbol_list = 21600;
    int ttl_symbol_info = 3600;
};

struct MarketDataConfig {
    std::string target = "localhost:50051";
    int timeout_seconds = 30;
    int bulk_timeout_seconds = 120;
    int rate_limit_calls = 5;
    int rate_limit_period_seconds = 1;
    int history_years = 20;
};

struct ServiceConfig {
    int interval_minutes = 60;
    std::string mode = "both";  // "service", "listener", "both", "once"
    std::string log_level = "info";
    std::vector<std::string> symbols;
    int bulk_workers = 4;
    std::string source = "market-data";
};

struct IndicatorConfig {
    bool enabled = true;
    std::string default_set = "default";
};

struct Config {
    DatabaseConfig database;
    RedisConfig redis;
    MarketDataConfig market_data;
    ServiceConfig service;
    IndicatorConfig indicators;
    MergePolicy merge;

    /// Load from JSON file, then override with environment variables.
    static Config load(const std::string& path);
};

} // namespace sde
