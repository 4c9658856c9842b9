#include "redis_bus.h"
#include "errors.h"
#include "json_builder.h"

#include <cerrno>
#include <cstring>
#include <hiredis/hiredis.h>
#include <mutex>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sde {

namespace {

// How long a blocked subscriber read waits before re-checking keep_running.
constexpr struct timeval SUBSCRIBE_POLL = {1, 0};

redisContext* open_context(const RedisConfig& config) {
    struct timeval timeout = {config.timeout_ms / 1000, (config.timeout_ms % 1000) * 1000};
    redisContext* ctx = redisConnectWithTimeout(config.host.c_str(), config.port, timeout);
    if (!ctx || ctx->err) {
        std::string err = ctx ? ctx->errstr : "null context";
        if (ctx) redisFree(ctx);
        throw StockDataError("Redis connect failed: " + err);
    }
    return ctx;
}

bool is_read_timeout(const redisContext* ctx) {
#ifdef REDIS_ERR_TIMEOUT
    if (ctx->err == REDIS_ERR_TIMEOUT) return true;
#endif
    return ctx->err == REDIS_ERR_IO && (errno == EAGAIN || errno == EWOULDBLOCK);
}

} // anonymous namespace

struct RedisBus::Impl {
    RedisConfig config;
    redisContext* pub_ctx = nullptr;
    std::mutex mtx;

    Impl(const RedisConfig& cfg) : config(cfg) {
        pub_ctx = open_context(config);
        spdlog::info("Connected to Redis at {}:{}", config.host, config.port);
    }

    ~Impl() {
        if (pub_ctx) redisFree(pub_ctx);
    }

    // Drop a broken publish context and open a fresh one.
    bool reconnect() {
        if (pub_ctx) redisFree(pub_ctx);
        pub_ctx = nullptr;
        try {
            pub_ctx = open_context(config);
            return true;
        } catch (const StockDataError& e) {
            spdlog::error("{}", e.what());
            return false;
        }
    }
};


RedisBus::RedisBus(const RedisConfig& config) : impl_(std::make_unique<Impl>(config)) {}
RedisBus::~RedisBus() = default;


json BusEvent::to_json() const {
    return json{
        {"event_type", event_type},
        {"payload", payload},
        {"source", source},
        {"correlation_id", correlation_id},
    };
}


BusEvent BusEvent::parse(const std::string& event_type, const std::string& message) {
    json j = json::parse(message, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ValidationError("event on " + event_type + " is not a JSON object");
    }

    BusEvent ev;
    ev.event_type = j.value("event_type", event_type);
    ev.source = j.value("source", "");
    ev.correlation_id = j.value("correlation_id", "");
    if (j.contains("payload") && j["payload"].is_object()) ev.payload = j["payload"];
    return ev;
}


bool RedisBus::publish_event(const BusEvent& event) {
    const std::string channel = channel_for(event.event_type);
    const std::string message = dump_lenient(event.to_json());

    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->pub_ctx && !impl_->reconnect()) return false;

    redisReply* reply = static_cast<redisReply*>(
        redisCommand(impl_->pub_ctx, "PUBLISH %s %b", channel.c_str(), message.data(), message.size()));

    if (!reply) {
        spdlog::error("Redis PUBLISH to {} failed: {}", channel, impl_->pub_ctx->errstr);
        impl_->reconnect();
        return false;
    }
    bool ok = reply->type != REDIS_REPLY_ERROR;
    long long receivers = reply->type == REDIS_REPLY_INTEGER ? reply->integer : 0;
    freeReplyObject(reply);

    spdlog::debug("Published {} ({}) to {} subscriber(s)", event.event_type, event.correlation_id, receivers);
    return ok;
}


void RedisBus::listen(const std::string& event_type, EventHandler handler, KeepRunning keep_running) {
    const std::string channel = channel_for(event_type);

    // A subscribed hiredis context accepts no other commands
    redisContext* sub_ctx = open_context(impl_->config);

    redisReply* reply = static_cast<redisReply*>(
        redisCommand(sub_ctx, "SUBSCRIBE %s", channel.c_str()));
    if (!reply) {
        std::string err = sub_ctx->errstr;
        redisFree(sub_ctx);
        throw StockDataError("Redis SUBSCRIBE failed: " + err);
    }
    freeReplyObject(reply);

    redisSetTimeout(sub_ctx, SUBSCRIBE_POLL);
    spdlog::info("Subscribed to Redis channel: {}", channel);

    while (keep_running()) {
        redisReply* msg = nullptr;
        if (redisGetReply(sub_ctx, reinterpret_cast<void**>(&msg)) != REDIS_OK) {
            if (is_read_timeout(sub_ctx)) {
                // hiredis leaves the context flagged after a timeout; clear it
                sub_ctx->err = 0;
                std::memset(sub_ctx->errstr, 0, sizeof(sub_ctx->errstr));
                continue;
            }
            spdlog::error("Redis subscribe read error: {}", sub_ctx->errstr);
            break;
        }

        if (msg && msg->type == REDIS_REPLY_ARRAY && msg->elements >= 3 &&
            std::string(msg->element[0]->str, msg->element[0]->len) == "message")
        {
            std::string data(msg->element[2]->str, msg->element[2]->len);
            try {
                handler(BusEvent::parse(event_type, data));
            } catch (const ValidationError& e) {
                spdlog::warn("Skipping message on {}: {}", channel, e.what());
            }
        }
        if (msg) freeReplyObject(msg);
    }

    redisFree(sub_ctx);
    spdlog::info("Unsubscribed from Redis channel: {}", channel);
}


std::string RedisBus::channel_for(const std::string& event_type) const {
    return impl_->config.channel_prefix + ":" + event_type;
}


bool RedisBus::health_check() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->pub_ctx) return false;
    redisReply* reply = static_cast<redisReply*>(redisCommand(impl_->pub_ctx, "PING"));
    if (!reply) return false;
    bool ok = (reply->type == REDIS_REPLY_STATUS && std::string(reply->str) == "PONG");
    freeReplyObject(reply);
    return ok;
}

} // namespace sde
