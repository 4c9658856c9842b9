#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sde {

std::string DatabaseConfig::connection_string() const {
    return "host=" + host +
           " port=" + std::to_string(port) +
           " dbname=" + dbname +
           " user=" + user +
           " password=" + password +
           " connect_timeout=" + std::to_string(connect_timeout_seconds);
}

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    return val ? std::atoi(val) : fallback;
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string s(val);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.count(key)) out = section[key].get<T>();
}

} // anonymous namespace

Config Config::load(const std::string& path) {
    Config cfg;

    // Load from JSON file if it exists
    std::ifstream f(path);
    if (f.is_open()) {
        try {
            json j = json::parse(f);

            if (j.count("database")) {
                auto& db = j["database"];
                read_key(db, "host", cfg.database.host);
                read_key(db, "port", cfg.database.port);
                read_key(db, "dbname", cfg.database.dbname);
                read_key(db, "user", cfg.database.user);
                read_key(db, "password", cfg.database.password);
                read_key(db, "connect_timeout_seconds", cfg.database.connect_timeout_seconds);
                read_key(db, "statement_timeout_ms", cfg.database.statement_timeout_ms);
            }

            if (j.count("redis")) {
                auto& r = j["redis"];
                read_key(r, "host", cfg.redis.host);
                read_key(r, "port", cfg.redis.port);
                read_key(r, "channel_prefix", cfg.redis.channel_prefix);
                read_key(r, "cache_enabled", cfg.redis.cache_enabled);
                read_key(r, "timeout_ms", cfg.redis.timeout_ms);
                read_key(r, "ttl_latest_price", cfg.redis.ttl_latest_price);
                read_key(r, "ttl_recent_data", cfg.redis.ttl_recent_data);
                read_key(r, "ttl_symbol_list", cfg.redis.ttl_symbol_list);
                read_key(r, "ttl_symbol_info", cfg.redis.ttl_symbol_info);
            }

            if (j.count("market_data")) {
                auto& m = j["market_data"];
                read_key(m, "target", cfg.market_data.target);
                read_key(m, "timeout_seconds", cfg.market_data.timeout_seconds);
                read_key(m, "bulk_timeout_seconds", cfg.market_data.bulk_timeout_seconds);
                read_key(m, "rate_limit_calls", cfg.market_data.rate_limit_calls);
                read_key(m, "rate_limit_period_seconds", cfg.market_data.rate_limit_period_seconds);
                read_key(m, "history_years", cfg.market_data.history_years);
            }

            if (j.count("service")) {
                auto& s = j["service"];
                read_key(s, "interval_minutes", cfg.service.interval_minutes);
                read_key(s, "mode", cfg.service.mode);
                read_key(s, "log_level", cfg.service.log_level);
                read_key(s, "symbols", cfg.service.symbols);
                read_key(s, "bulk_workers", cfg.service.bulk_workers);
                read_key(s, "source", cfg.service.source);
            }

            if (j.count("indicators")) {
                auto& ind = j["indicators"];
                read_key(ind, "enabled", cfg.indicators.enabled);
                read_key(ind, "default_set", cfg.indicators.default_set);
            }

            if (j.count("merge")) {
                auto& m = j["merge"];
                read_key(m, "price_threshold", cfg.merge.price_threshold);
                read_key(m, "volume_threshold", cfg.merge.volume_threshold);
                read_key(m, "gap_days", cfg.merge.gap_days);
                read_key(m, "max_gap_warnings", cfg.merge.max_gap_warnings);
            }

            spdlog::info("Loaded config from {}", path);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to parse config file {}: {}", path, e.what());
        }
    } else {
        spdlog::info("Config file {} not found, using defaults + env vars", path);
    }

    // Override with environment variables
    cfg.database.host = env_or("DB_HOST", cfg.database.host);
    cfg.database.port = env_int_or("DB_PORT", cfg.database.port);
    cfg.database.dbname = env_or("DB_NAME", cfg.database.dbname);
    cfg.database.user = env_or("DB_USER", cfg.database.user);
    cfg.database.password = env_or("DB_PASSWORD", cfg.database.password);

    cfg.redis.host = env_or("REDIS_HOST", cfg.redis.host);
    cfg.redis.port = env_int_or("REDIS_PORT", cfg.redis.port);
    cfg.redis.channel_prefix = env_or("REDIS_CHANNEL_PREFIX", cfg.redis.channel_prefix);
    cfg.redis.cache_enabled = env_bool_or("CACHE_ENABLED", cfg.redis.cache_enabled);

    cfg.market_data.target = env_or("MARKET_DATA_TARGET", cfg.market_data.target);

    cfg.service.mode = env_or("ENGINE_MODE", cfg.service.mode);
    cfg.service.log_level = env_or("ENGINE_LOG_LEVEL", cfg.service.log_level);
    cfg.service.interval_minutes = env_int_or("ENGINE_INTERVAL_MINUTES", cfg.service.interval_minutes);

    cfg.indicators.enabled = env_bool_or("ENABLE_INDICATOR_CALCULATION", cfg.indicators.enabled);

    cfg.service.bulk_workers = std::max(1, cfg.service.bulk_workers);
    cfg.market_data.rate_limit_calls = std::max(1, cfg.market_data.rate_limit_calls);

    return cfg;
}

} // namespace sde
