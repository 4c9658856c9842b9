#include "download_service.h"
#include "cache/cache_keys.h"
#include "errors.h"
#include "indicators/indicator_sets.h"
#include "json_builder.h"
#include "storage/storage_paths.h"

#include <algorithm>
#include <atomic>
#include <spdlog/spdlog.h>
#include <thread>

using json = nlohmann::json;

namespace sde {

const char* status_name(SyncResult::Status status) {
    switch (status) {
        case SyncResult::Status::Success:   return "success";
        case SyncResult::Status::NoNewData: return "no_new_data";
        case SyncResult::Status::NotFound:  return "not_found";
        case SyncResult::Status::Error:     return "error";
        case SyncResult::Status::Skipped:   return "skipped";
    }
    return "error";
}

json SyncResult::to_json() const {
    json j = {
        {"status", status_name(status)},
        {"symbol", symbol},
        {"message", message},
        {"daily_records", daily_records},
        {"weekly_records", weekly_records},
        {"new_points", new_points},
        {"duplicates", duplicates},
        {"overwrites", overwrites},
        {"indicators", indicators},
        {"warnings", warnings},
    };
    if (range_start && range_end) {
        j["date_range"] = {{"start", range_start->iso()}, {"end", range_end->iso()}};
    } else {
        j["date_range"] = nullptr;
    }
    return j;
}

int BulkResult::succeeded() const {
    return static_cast<int>(std::count_if(results.begin(), results.end(),
                                          [](const SyncResult& r) { return r.ok(); }));
}

int BulkResult::failed() const {
    return static_cast<int>(results.size()) - succeeded();
}

json BulkResult::to_json() const {
    json items = json::array();
    for (const auto& r : results) items.push_back(r.to_json());
    return {
        {"total", results.size()},
        {"succeeded", succeeded()},
        {"failed", failed()},
        {"results", std::move(items)},
    };
}


namespace {

std::optional<Date> request_date(const json& payload, const char* field) {
    if (!payload.contains(field) || payload[field].is_null()) return std::nullopt;
    try {
        return Date::parse(payload[field].get<std::string>());
    } catch (const std::exception& e) {
        throw ValidationError(std::string(field) + ": " + e.what());
    }
}

} // anonymous namespace

DownloadRequest DownloadRequest::from_json(const json& payload) {
    if (!payload.is_object()) throw ValidationError("request payload must be an object");

    DownloadRequest req;
    try {
        req.symbol = normalize_symbol(payload.value("symbol", std::string()));
        req.mode = payload.value("mode", req.mode);
        req.force = payload.value("force", false);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed request: ") + e.what());
    }
    req.start_date = request_date(payload, "start_date");
    req.end_date = request_date(payload, "end_date");
    return req;
}


DownloadService::DownloadService(const Config& config,
                                 MarketDataProvider& provider,
                                 BlobStore& store,
                                 Cache& cache)
    : config_(config),
      provider_(provider),
      store_(store),
      cache_(cache),
      catalog_(store),
      merger_(config.merge) {}


std::chrono::seconds DownloadService::timeout() const {
    return std::chrono::seconds(config_.market_data.timeout_seconds);
}

std::chrono::seconds DownloadService::bulk_timeout() const {
    return std::chrono::seconds(config_.market_data.bulk_timeout_seconds);
}

std::vector<std::string> DownloadService::indicator_ids() const {
    return IndicatorSetManager::resolve(config_.indicators.default_set);
}


template <typename Fn>
SyncResult DownloadService::guarded(const std::string& symbol, const char* operation, Fn&& fn) {
    try {
        return fn();
    } catch (const StockDataError& e) {
        spdlog::error("{} {} failed: {}", operation, symbol, e.what());
        SyncResult r;
        r.status = SyncResult::Status::Error;
        r.symbol = symbol;
        r.message = e.what();
        return r;
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed with unexpected error: {}", operation, symbol, e.what());
        SyncResult r;
        r.status = SyncResult::Status::Error;
        r.symbol = symbol;
        r.message = std::string("unexpected error: ") + e.what();
        return r;
    }
}


SyncResult DownloadService::download_full(const std::string& symbol,
                                          std::optional<Date> start,
                                          std::optional<Date> end)
{
    const std::string sym = normalize_symbol(symbol);
    Date to = end.value_or(Date::today());
    Date from = start.value_or(to - (config_.market_data.history_years * 365 +
                                     config_.market_data.history_years / 4));
    return guarded(sym, "Full download", [&] { return full_download(sym, from, to, timeout()); });
}


SyncResult DownloadService::update_incremental(const std::string& symbol) {
    const std::string sym = normalize_symbol(symbol);
    return guarded(sym, "Incremental update", [&] { return incremental_update(sym, timeout()); });
}


SyncResult DownloadService::full_download(const std::string& symbol, const Date& start, const Date& end,
                                          std::chrono::seconds timeout)
{
    SyncResult result;
    result.symbol = symbol;

    if (end < start) {
        throw ValidationError("start " + start.iso() + " is after end " + end.iso());
    }

    spdlog::info("Downloading {} [{} .. {}]", symbol, start.iso(), end.iso());
    auto raw = provider_.fetch(symbol, start, end, timeout);
    if (raw.empty()) {
        spdlog::warn("No data returned for {}", symbol);
        result.status = SyncResult::Status::NotFound;
        result.message = "no data returned for " + symbol;
        return result;
    }

    auto converted = convert_raw_bars(raw);
    result.warnings = std::move(converted.warnings);
    if (converted.bars.empty()) {
        result.status = SyncResult::Status::NotFound;
        result.message = "no valid rows for " + symbol;
        return result;
    }

    result.new_points = static_cast<int>(converted.bars.size());
    write_series(symbol, std::move(converted.bars), result);
    result.message = "downloaded " + std::to_string(result.daily_records) + " daily records";
    return result;
}


SyncResult DownloadService::incremental_update(const std::string& symbol, std::chrono::seconds timeout) {
    auto existing = load_daily(symbol);
    if (!existing || existing->empty()) {
        spdlog::info("No stored data for {}, falling back to full download", symbol);
        Date today = Date::today();
        Date from = today - (config_.market_data.history_years * 365 + config_.market_data.history_years / 4);
        return full_download(symbol, from, today, timeout);
    }

    SyncResult result;
    result.symbol = symbol;

    Date latest = existing->bars.back().date;
    Date start = latest - 1;
    Date end = Date::today() + 1;

    spdlog::info("Incremental update for {} [{} .. {}]", symbol, start.iso(), end.iso());
    auto raw = provider_.fetch(symbol, start, end, timeout);
    auto converted = convert_raw_bars(raw);
    result.warnings = std::move(converted.warnings);

    auto merged = merger_.merge(existing->bars, converted.bars);
    result.new_points = merged.stats.new_points;
    result.duplicates = merged.stats.duplicates;
    result.overwrites = merged.stats.overwrites;
    result.warnings.insert(result.warnings.end(),
                           merged.stats.warnings.begin(), merged.stats.warnings.end());

    // Corrections to stored bars alone do not trigger a rewrite; they stay as warnings.
    if (merged.stats.new_points == 0) {
        spdlog::info("No new data for {} ({} duplicates, {} corrections not applied)",
                     symbol, merged.stats.duplicates, merged.stats.overwrites);
        result.status = SyncResult::Status::NoNewData;
        result.message = "no new data";
        result.daily_records = existing->record_count();
        result.range_start = existing->range_start;
        result.range_end = existing->range_end;
        return result;
    }

    write_series(symbol, std::move(merged.merged), result);
    result.message = "added " + std::to_string(result.new_points) + " new points";
    return result;
}


void DownloadService::write_series(const std::string& symbol, std::vector<DailyBar> bars, SyncResult& result) {
    DailyFile daily = make_symbol_file(symbol, std::move(bars), config_.service.source);

    if (config_.indicators.enabled) {
        auto ids = indicator_ids();
        int required = IndicatorSetManager::required_periods(IndicatorSetManager::validate(ids));
        if (daily.record_count() < required) {
            spdlog::info("{}: {} daily bars, {} needed for the full indicator set",
                         symbol, daily.record_count(), required);
        }
        daily.indicators = calculator_.calculate_for_series(daily.bars, ids);
        for (const auto& [id, series] : daily.indicators) result.indicators.push_back(id);
    }

    persist(StoragePaths::daily(symbol), daily);
    result.daily_records = daily.record_count();
    result.range_start = daily.range_start;
    result.range_end = daily.range_end;
    spdlog::info("Stored {} daily records for {} ({} indicators)",
                 daily.record_count(), symbol, daily.indicators.size());

    result.weekly_records = write_weekly(symbol, daily.bars, result);

    invalidate_cache(symbol);
    refresh_catalog(symbol, result);
    result.status = SyncResult::Status::Success;
}


int DownloadService::write_weekly(const std::string& symbol, const std::vector<DailyBar>& daily,
                                  SyncResult& result)
{
    auto weekly_bars = aggregator_.aggregate_to_weekly(daily);
    if (weekly_bars.empty()) {
        result.warnings.push_back("no weekly data generated for " + symbol);
        spdlog::warn("No weekly data generated for {}", symbol);
        return 0;
    }

    WeeklyFile weekly = make_symbol_file(symbol, std::move(weekly_bars), config_.service.source);
    if (config_.indicators.enabled) {
        weekly.indicators = calculator_.calculate_for_series(weekly.bars, indicator_ids());
    }

    persist(StoragePaths::weekly(symbol), weekly);
    spdlog::info("Stored {} weekly records for {}", weekly.record_count(), symbol);
    return weekly.record_count();
}


template <typename Bar>
void DownloadService::persist(const std::string& key, const StoredSymbolFile<Bar>& file) {
    if (!store_.put_json(key, json(file))) {
        throw StorageError("failed to write " + key);
    }
}


void DownloadService::invalidate_cache(const std::string& symbol) {
    for (const auto& key : CacheKeys::all_for_symbol(symbol)) {
        cache_.remove(key);
    }
    spdlog::debug("Invalidated cache for {}", symbol);
}


void DownloadService::refresh_catalog(const std::string& symbol, SyncResult& result) {
    std::lock_guard<std::mutex> lock(catalog_mtx_);
    if (!catalog_.update_for_symbol(symbol)) {
        result.warnings.push_back("catalog update failed for " + symbol);
    }
}


std::optional<DailyFile> DownloadService::load_daily(const std::string& symbol) const {
    auto body = store_.get_json(StoragePaths::daily(symbol));
    if (!body) return std::nullopt;
    return body->get<DailyFile>();
}


BulkResult DownloadService::download_bulk(const std::vector<std::string>& symbols, BulkMode mode) {
    BulkResult bulk;
    bulk.results.resize(symbols.size());
    if (symbols.empty()) return bulk;

    const int workers = std::min<int>(std::max(1, config_.service.bulk_workers),
                                      static_cast<int>(symbols.size()));
    spdlog::info("Bulk {} of {} symbols on {} workers",
                 mode == BulkMode::Full ? "download" : "update", symbols.size(), workers);

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < symbols.size(); i = next++) {
            const std::string sym = normalize_symbol(symbols[i]);
            if (mode == BulkMode::Full) {
                Date to = Date::today();
                Date from = to - (config_.market_data.history_years * 365 +
                                  config_.market_data.history_years / 4);
                bulk.results[i] = guarded(sym, "Bulk download",
                                          [&] { return full_download(sym, from, to, bulk_timeout()); });
            } else {
                bulk.results[i] = guarded(sym, "Bulk update",
                                          [&] { return incremental_update(sym, bulk_timeout()); });
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (int w = 0; w < workers; w++) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    spdlog::info("Bulk complete: {} succeeded, {} failed", bulk.succeeded(), bulk.failed());
    return bulk;
}


SyncResult DownloadService::sync_weekly(const std::string& symbol, bool force) {
    const std::string sym = normalize_symbol(symbol);
    return guarded(sym, "Weekly sync", [&] {
        SyncResult result;
        result.symbol = sym;

        if (!force && store_.exists(StoragePaths::weekly(sym))) {
            result.status = SyncResult::Status::Skipped;
            result.message = "weekly data already exists";
            return result;
        }

        auto daily = load_daily(sym);
        if (!daily || daily->empty()) {
            result.status = SyncResult::Status::NotFound;
            result.message = "no daily data for " + sym;
            return result;
        }

        result.daily_records = daily->record_count();
        result.range_start = daily->range_start;
        result.range_end = daily->range_end;
        result.weekly_records = write_weekly(sym, daily->bars, result);

        invalidate_cache(sym);
        refresh_catalog(sym, result);
        result.status = SyncResult::Status::Success;
        result.message = "rebuilt " + std::to_string(result.weekly_records) + " weekly records";
        return result;
    });
}


SyncResult DownloadService::delete_symbol(const std::string& symbol) {
    const std::string sym = normalize_symbol(symbol);
    return guarded(sym, "Delete", [&] {
        SyncResult result;
        result.symbol = sym;

        const std::string daily_key = StoragePaths::daily(sym);
        const std::string weekly_key = StoragePaths::weekly(sym);
        bool had_daily = store_.exists(daily_key);
        bool had_weekly = store_.exists(weekly_key);

        if (!had_daily && !had_weekly) {
            result.status = SyncResult::Status::NotFound;
            result.message = "no stored data for " + sym;
            return result;
        }

        if (had_daily && !store_.remove(daily_key)) throw StorageError("failed to delete " + daily_key);
        if (had_weekly && !store_.remove(weekly_key)) throw StorageError("failed to delete " + weekly_key);

        invalidate_cache(sym);
        refresh_catalog(sym, result);

        spdlog::info("Deleted stored data for {}", sym);
        result.status = SyncResult::Status::Success;
        result.message = "deleted";
        return result;
    });
}

} // namespace sde
