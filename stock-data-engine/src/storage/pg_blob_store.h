#pragma once

#include "config.h"
#include "storage/blob_store.h"

#include <memory>

namespace sde {

/// BlobStore backed by one PostgreSQL table via libpq:
///
///   blob_objects(key TEXT PRIMARY KEY, body JSONB NOT NULL, updated_at TIMESTAMPTZ)
///
/// The table is created on first connect. All calls share one connection
/// guarded by a mutex and reconnect when it drops.
class PgBlobStore : public BlobStore {
public:
    explicit PgBlobStore(const DatabaseConfig& config);
    ~PgBlobStore() override;

    PgBlobStore(const PgBlobStore&) = delete;
    PgBlobStore& operator=(const PgBlobStore&) = delete;

    std::optional<nlohmann::json> get_json(const std::string& key) override;
    bool put_json(const std::string& key, const nlohmann::json& value) override;
    bool exists(const std::string& key) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix) override;

    /// Check database connectivity.
    bool health_check() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sde
