#pragma once

#include "config.h"

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace sde {

/// Envelope carried on every stockdata:<event_type> channel.
struct BusEvent {
    std::string event_type;
    nlohmann::json payload = nlohmann::json::object();
    std::string source;
    std::string correlation_id;

    nlohmann::json to_json() const;

    /// Missing fields default to empty; non-object messages throw ValidationError.
    static BusEvent parse(const std::string& event_type, const std::string& message);
};

/// Event bus over Redis pub/sub. Publishing shares one lazily repaired
/// connection; each listen() call opens its own subscriber connection.
class RedisBus {
public:
    explicit RedisBus(const RedisConfig& config);
    ~RedisBus();

    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

    using EventHandler = std::function<void(const BusEvent& event)>;
    using KeepRunning = std::function<bool()>;

    /// Publish to channel_for(event.event_type). Returns false when Redis
    /// could not be reached or rejected the command.
    bool publish_event(const BusEvent& event);

    /// Block on channel_for(event_type), decoding each message into a BusEvent.
    /// Undecodable messages are logged and skipped. `keep_running` is polled
    /// at least once a second; the call returns once it yields false.
    /// Throws StockDataError when the subscriber connection cannot be opened.
    void listen(const std::string& event_type, EventHandler handler, KeepRunning keep_running);

    std::string channel_for(const std::string& event_type) const;

    bool health_check() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sde
