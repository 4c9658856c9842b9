#include "storage/pg_blob_store.h"
#include "errors.h"
#include "json_builder.h"

#include <libpq-fe.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace sde {

namespace {

constexpr const char* CREATE_TABLE_SQL =
    "CREATE TABLE IF NOT EXISTS blob_objects ("
    " key TEXT PRIMARY KEY,"
    " body JSONB NOT NULL,"
    " updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW())";

/// Owns a PGresult for the duration of a call.
struct ResultGuard {
    PGresult* res;
    explicit ResultGuard(PGresult* r) : res(r) {}
    ~ResultGuard() { if (res) PQclear(res); }
    ResultGuard(const ResultGuard&) = delete;
    ResultGuard& operator=(const ResultGuard&) = delete;
};

} // anonymous namespace

struct PgBlobStore::Impl {
    DatabaseConfig config;
    PGconn* conn = nullptr;
    mutable std::mutex mtx;

    Impl(const DatabaseConfig& cfg) : config(cfg) {
        connect();
    }

    ~Impl() {
        if (conn) PQfinish(conn);
    }

    void connect() {
        conn = PQconnectdb(config.connection_string().c_str());
        if (PQstatus(conn) != CONNECTION_OK) {
            std::string err = PQerrorMessage(conn);
            PQfinish(conn);
            conn = nullptr;
            throw StorageError("DB connect failed: " + err);
        }
        spdlog::info("Connected to PostgreSQL at {}:{}/{}", config.host, config.port, config.dbname);

        std::string timeout = "SET statement_timeout = " + std::to_string(config.statement_timeout_ms);
        ResultGuard set(PQexec(conn, timeout.c_str()));
        if (!set.res || PQresultStatus(set.res) != PGRES_COMMAND_OK) {
            spdlog::warn("Could not set statement_timeout: {}", PQerrorMessage(conn));
        }

        ResultGuard create(PQexec(conn, CREATE_TABLE_SQL));
        if (!create.res || PQresultStatus(create.res) != PGRES_COMMAND_OK) {
            throw StorageError(std::string("create blob_objects failed: ") + PQerrorMessage(conn));
        }
    }

    void ensure_connected() {
        if (!conn || PQstatus(conn) != CONNECTION_OK) {
            spdlog::warn("DB connection lost, reconnecting...");
            if (conn) PQfinish(conn);
            conn = nullptr;
            connect();
        }
    }

    PGresult* exec_params(const char* sql, int nParams, const char* const* paramValues) {
        ensure_connected();
        PGresult* res = PQexecParams(conn, sql, nParams, nullptr, paramValues, nullptr, nullptr, 0);
        if (!res) throw StorageError(std::string("PQexecParams returned null: ") + PQerrorMessage(conn));
        return res;
    }
};


PgBlobStore::PgBlobStore(const DatabaseConfig& config) : impl_(std::make_unique<Impl>(config)) {}
PgBlobStore::~PgBlobStore() = default;


std::optional<nlohmann::json> PgBlobStore::get_json(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    const char* params[] = {key.c_str()};
    ResultGuard r(impl_->exec_params("SELECT body::text FROM blob_objects WHERE key = $1", 1, params));
    if (PQresultStatus(r.res) != PGRES_TUPLES_OK) {
        throw StorageError("get_json(" + key + ") failed: " + PQresultErrorMessage(r.res));
    }
    if (PQntuples(r.res) == 0) return std::nullopt;

    try {
        return nlohmann::json::parse(PQgetvalue(r.res, 0, 0));
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("get_json(" + key + ") returned invalid JSON: " + e.what());
    }
}


bool PgBlobStore::put_json(const std::string& key, const nlohmann::json& value) {
    std::string body = dump_lenient(value);

    std::lock_guard<std::mutex> lock(impl_->mtx);
    const char* params[] = {key.c_str(), body.c_str()};
    try {
        ResultGuard r(impl_->exec_params(
            "INSERT INTO blob_objects (key, body, updated_at) VALUES ($1, $2::jsonb, NOW()) "
            "ON CONFLICT (key) DO UPDATE SET body = EXCLUDED.body, updated_at = EXCLUDED.updated_at",
            2, params));
        if (PQresultStatus(r.res) != PGRES_COMMAND_OK) {
            spdlog::error("put_json({}) failed: {}", key, PQresultErrorMessage(r.res));
            return false;
        }
    } catch (const StorageError& e) {
        spdlog::error("put_json({}) failed: {}", key, e.what());
        return false;
    }

    spdlog::debug("Stored {} ({} bytes)", key, body.size());
    return true;
}


bool PgBlobStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    const char* params[] = {key.c_str()};
    ResultGuard r(impl_->exec_params("SELECT 1 FROM blob_objects WHERE key = $1", 1, params));
    if (PQresultStatus(r.res) != PGRES_TUPLES_OK) {
        throw StorageError("exists(" + key + ") failed: " + PQresultErrorMessage(r.res));
    }
    return PQntuples(r.res) > 0;
}


bool PgBlobStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    const char* params[] = {key.c_str()};
    try {
        ResultGuard r(impl_->exec_params("DELETE FROM blob_objects WHERE key = $1", 1, params));
        if (PQresultStatus(r.res) != PGRES_COMMAND_OK) {
            spdlog::error("remove({}) failed: {}", key, PQresultErrorMessage(r.res));
            return false;
        }
    } catch (const StorageError& e) {
        spdlog::error("remove({}) failed: {}", key, e.what());
        return false;
    }
    return true;
}


std::vector<std::string> PgBlobStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(impl_->mtx);

    const char* params[] = {prefix.c_str()};
    ResultGuard r(impl_->exec_params(
        "SELECT key FROM blob_objects WHERE left(key, length($1)) = $1 ORDER BY key", 1, params));
    if (PQresultStatus(r.res) != PGRES_TUPLES_OK) {
        throw StorageError("list(" + prefix + ") failed: " + PQresultErrorMessage(r.res));
    }

    std::vector<std::string> keys;
    keys.reserve(PQntuples(r.res));
    for (int i = 0; i < PQntuples(r.res); i++) {
        keys.emplace_back(PQgetvalue(r.res, i, 0));
    }
    return keys;
}


bool PgBlobStore::health_check() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->conn && PQstatus(impl_->conn) == CONNECTION_OK;
}

} // namespace sde
