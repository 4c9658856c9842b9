#pragma once

#include "cache/cache.h"
#include "config.h"

#include <memory>

namespace sde {

/// Cache on Redis via hiredis (GET / SET EX / DEL).
///
/// Connects lazily and reconnects after any error. Failures are logged
/// at warn and turn into a miss or a no-op.
class RedisCache : public Cache {
public:
    explicit RedisCache(const RedisConfig& config);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    std::optional<nlohmann::json> get_json(const std::string& key) override;
    void set_json(const std::string& key, const nlohmann::json& value, int ttl_seconds) override;
    void remove(const std::string& key) override;
    bool enabled() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sde
