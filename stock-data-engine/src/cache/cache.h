#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sde {

/// Best-effort TTL cache in front of the blob store. Never the source of
/// truth: implementations swallow every failure and report a miss.
class Cache {
public:
    virtual ~Cache() = default;

    virtual std::optional<nlohmann::json> get_json(const std::string& key) = 0;
    virtual void set_json(const std::string& key, const nlohmann::json& value, int ttl_seconds) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual bool enabled() const = 0;
};

} // namespace sde
