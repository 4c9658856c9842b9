#pragma once

#include "cache/cache.h"
#include "catalog_manager.h"
#include "config.h"
#include "indicators/calculator.h"
#include "market_data_provider.h"
#include "series/merger.h"
#include "series/weekly_aggregator.h"
#include "storage/blob_store.h"
#include "storage/symbol_file.h"

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sde {

/// Outcome of one per-symbol pipeline run.
struct SyncResult {
    enum class Status { Success, NoNewData, NotFound, Error, Skipped };

    Status status = Status::Success;
    std::string symbol;
    std::string message;
    int daily_records = 0;
    int weekly_records = 0;
    int new_points = 0;
    int duplicates = 0;
    int overwrites = 0;
    std::optional<Date> range_start;
    std::optional<Date> range_end;
    std::vector<std::string> indicators;   // daily identifiers written
    std::vector<std::string> warnings;

    /// Success, NoNewData and Skipped are not failures.
    bool ok() const { return status != Status::Error && status != Status::NotFound; }

    nlohmann::json to_json() const;
};

/// "success", "no_new_data", "not_found", "error" or "skipped".
const char* status_name(SyncResult::Status status);

struct BulkResult {
    std::vector<SyncResult> results;   // same order as the requested symbols

    int succeeded() const;
    int failed() const;

    nlohmann::json to_json() const;
};

/// Decoded payload of a download_request event.
struct DownloadRequest {
    std::string symbol;                 // normalized; empty when missing
    std::string mode = "incremental";   // full, incremental, weekly or delete
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    bool force = false;

    /// Throws ValidationError when a field has the wrong type or a date
    /// does not parse.
    static DownloadRequest from_json(const nlohmann::json& payload);
};

/// Per-symbol ingestion pipeline.
///
/// Steps for one symbol run strictly in order: daily persist, weekly
/// compute, weekly persist, cache invalidation, catalog update. Callers must
/// not run two pipelines for the same symbol concurrently.
class DownloadService {
public:
    enum class BulkMode { Full, Incremental };

    DownloadService(const Config& config,
                    MarketDataProvider& provider,
                    BlobStore& store,
                    Cache& cache);

    /// Full download for [start, end]; defaults to the configured history
    /// window ending today.
    SyncResult download_full(const std::string& symbol,
                             std::optional<Date> start = std::nullopt,
                             std::optional<Date> end = std::nullopt);

    /// Fetch [latest stored date - 1, tomorrow] and merge it into the stored
    /// series. Falls back to download_full when nothing is stored yet.
    SyncResult update_incremental(const std::string& symbol);

    /// Runs each symbol on a bounded worker pool. One symbol's failure is
    /// reported in its own result and never affects the others.
    BulkResult download_bulk(const std::vector<std::string>& symbols, BulkMode mode = BulkMode::Full);

    /// Rebuild the weekly file from the stored daily file. Skipped when a
    /// weekly file exists, unless forced.
    SyncResult sync_weekly(const std::string& symbol, bool force = false);

    /// Delete both files, invalidate cache, drop the catalog entry.
    SyncResult delete_symbol(const std::string& symbol);

    /// Stored daily file, nothing when absent. Throws StorageError / ValidationError.
    std::optional<DailyFile> load_daily(const std::string& symbol) const;

    /// Identifiers computed on every write.
    std::vector<std::string> indicator_ids() const;

    CatalogManager& catalog() { return catalog_; }

private:
    const Config& config_;
    MarketDataProvider& provider_;
    BlobStore& store_;
    Cache& cache_;
    CatalogManager catalog_;
    std::mutex catalog_mtx_;   // catalog.json is one shared read-modify-write blob
    IndicatorCalculator calculator_;
    WeeklyAggregator aggregator_;
    IncrementalMerger merger_;

    SyncResult full_download(const std::string& symbol, const Date& start, const Date& end,
                             std::chrono::seconds timeout);
    SyncResult incremental_update(const std::string& symbol, std::chrono::seconds timeout);

    /// Build, annotate and persist daily + weekly files from `bars`, then
    /// invalidate cache and update the catalog.
    void write_series(const std::string& symbol, std::vector<DailyBar> bars, SyncResult& result);

    /// Aggregate, annotate and persist the weekly file. Returns its bar count.
    int write_weekly(const std::string& symbol, const std::vector<DailyBar>& daily, SyncResult& result);

    template <typename Bar>
    void persist(const std::string& key, const StoredSymbolFile<Bar>& file);

    void invalidate_cache(const std::string& symbol);
    void refresh_catalog(const std::string& symbol, SyncResult& result);

    /// Runs `fn`, turning any exception into an Error result for `symbol`.
    template <typename Fn>
    SyncResult guarded(const std::string& symbol, const char* operation, Fn&& fn);

    std::chrono::seconds timeout() const;
    std::chrono::seconds bulk_timeout() const;
};

} // namespace sde
