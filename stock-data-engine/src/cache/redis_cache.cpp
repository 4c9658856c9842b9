#include "cache/redis_cache.h"
#include "json_builder.h"

#include <hiredis/hiredis.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace sde {

struct RedisCache::Impl {
    RedisConfig config;
    redisContext* ctx = nullptr;
    std::mutex mtx;

    Impl(const RedisConfig& cfg) : config(cfg) {}

    ~Impl() {
        if (ctx) redisFree(ctx);
    }

    void drop() {
        if (ctx) redisFree(ctx);
        ctx = nullptr;
    }

    /// Returns false (after logging) when Redis is unreachable.
    bool ensure_connected() {
        if (ctx && !ctx->err) return true;
        drop();

        struct timeval timeout = {config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000};
        ctx = redisConnectWithTimeout(config.host.c_str(), config.port, timeout);
        if (!ctx || ctx->err) {
            spdlog::warn("Redis cache connect failed: {}", ctx ? ctx->errstr : "null context");
            drop();
            return false;
        }
        redisSetTimeout(ctx, timeout);
        spdlog::info("Redis cache connected at {}:{}", config.host, config.port);
        return true;
    }

    /// Runs a command; nullptr (after logging) on any transport error.
    redisReply* command(const char* what, const char* fmt, const std::string& key) {
        if (!ensure_connected()) return nullptr;
        auto* reply = static_cast<redisReply*>(redisCommand(ctx, fmt, key.c_str()));
        if (!reply) {
            spdlog::warn("Redis {} {} failed: {}", what, key, ctx->errstr);
            drop();
        }
        return reply;
    }
};


RedisCache::RedisCache(const RedisConfig& config) : impl_(std::make_unique<Impl>(config)) {}
RedisCache::~RedisCache() = default;


bool RedisCache::enabled() const {
    return impl_->config.cache_enabled;
}


std::optional<nlohmann::json> RedisCache::get_json(const std::string& key) {
    if (!enabled()) return std::nullopt;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    redisReply* reply = impl_->command("GET", "GET %s", key);
    if (!reply) return std::nullopt;

    std::optional<nlohmann::json> out;
    if (reply->type == REDIS_REPLY_STRING) {
        try {
            out = nlohmann::json::parse(std::string(reply->str, reply->len));
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Redis GET {}: invalid cached JSON: {}", key, e.what());
        }
    } else if (reply->type == REDIS_REPLY_ERROR) {
        spdlog::warn("Redis GET {} error: {}", key, std::string(reply->str, reply->len));
    }
    freeReplyObject(reply);

    spdlog::debug("Cache {} for {}", out ? "hit" : "miss", key);
    return out;
}


void RedisCache::set_json(const std::string& key, const nlohmann::json& value, int ttl_seconds) {
    if (!enabled()) return;

    std::string body = dump_lenient(value);

    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->ensure_connected()) return;

    auto* reply = static_cast<redisReply*>(redisCommand(
        impl_->ctx, "SET %s %b EX %d", key.c_str(), body.data(), body.size(), ttl_seconds));
    if (!reply) {
        spdlog::warn("Redis SET {} failed: {}", key, impl_->ctx->errstr);
        impl_->drop();
        return;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        spdlog::warn("Redis SET {} error: {}", key, std::string(reply->str, reply->len));
    }
    freeReplyObject(reply);
}


void RedisCache::remove(const std::string& key) {
    if (!enabled()) return;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    redisReply* reply = impl_->command("DEL", "DEL %s", key);
    if (reply) freeReplyObject(reply);
}

} // namespace sde
