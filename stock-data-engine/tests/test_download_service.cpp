#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "cache/cache_keys.h"
#include "config.h"
#include "download_service.h"
#include "errors.h"
#include "fakes.h"
#include "rate_limiter.h"
#include "storage/storage_paths.h"
#include "storage/symbol_file.h"

using namespace sde;
using json = nlohmann::json;

namespace {

RawBar make_raw(const Date& date, double price, double volume = 1000000.0) {
    RawBar r;
    r.date = date;
    r.open = price;
    r.high = price + 1.0;
    r.low = price - 1.0;
    r.close = price + 0.5;
    r.adj_close = 0.0;
    r.volume = volume;
    return r;
}

// `n` weekday bars starting at `start`.
std::vector<RawBar> make_weekday_raw(const Date& start, int n) {
    std::vector<RawBar> out;
    for (Date d = start; static_cast<int>(out.size()) < n; d = d + 1) {
        if (d.weekday() >= 5) continue;
        out.push_back(make_raw(d, 100.0 + out.size() * 0.5));
    }
    return out;
}

// One bar per calendar day in [first, last].
std::vector<RawBar> make_daily_raw(const Date& first, const Date& last) {
    std::vector<RawBar> out;
    for (Date d = first; d <= last; d = d + 1) {
        out.push_back(make_raw(d, 50.0 + (d - first) * 0.25));
    }
    return out;
}

/// Service wired to in-memory collaborators.
struct Harness {
    Config config;
    fakes::InMemoryBlobStore store;
    fakes::InMemoryCache cache;
    fakes::FakeProvider provider;
    DownloadService service;

    Harness() : service(config, provider, store, cache) {}

    explicit Harness(const Config& cfg) : config(cfg), service(config, provider, store, cache) {}

    DailyFile daily(const std::string& symbol) {
        return store.get_json(StoragePaths::daily(symbol))->get<DailyFile>();
    }
};

Config small_pool_config() {
    Config cfg;
    cfg.service.bulk_workers = 2;
    return cfg;
}

const Date START = Date::parse("2024-01-01");
const Date END = Date::parse("2024-06-28");

} // anonymous namespace


// ========== Full Download Tests ==========

TEST(FullDownloadTest, WritesDailyWeeklyAndCatalog) {
    Harness h;
    h.provider.bars["AAPL"] = make_weekday_raw(START, 60);

    auto result = h.service.download_full("aapl", START, END);

    ASSERT_EQ(result.status, SyncResult::Status::Success) << result.message;
    EXPECT_EQ(result.symbol, "AAPL");
    EXPECT_EQ(result.daily_records, 60);
    EXPECT_EQ(result.weekly_records, 12);
    EXPECT_EQ(result.new_points, 60);
    EXPECT_EQ(result.range_start->iso(), "2024-01-01");
    EXPECT_EQ(result.indicators.size(), 6u);

    auto daily = h.daily("AAPL");
    EXPECT_EQ(daily.record_count(), 60);
    EXPECT_EQ(daily.indicators.count("SMA_50"), 1u);
    EXPECT_DOUBLE_EQ(daily.bars[0].adj_close, daily.bars[0].close);

    auto weekly = h.store.get_json(StoragePaths::weekly("AAPL"))->get<WeeklyFile>();
    EXPECT_EQ(weekly.record_count(), 12);
    EXPECT_EQ(weekly.trading_days(), 60);

    auto entry = h.service.catalog().load().find("AAPL");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->total_days, 60);
    EXPECT_TRUE(entry->has_weekly);

    for (const auto& key : CacheKeys::all_for_symbol("AAPL")) {
        EXPECT_TRUE(h.cache.removed.count(key)) << key;
    }
}

TEST(FullDownloadTest, ShortHistoryOmitsLongIndicators) {
    Harness h;
    h.provider.bars["NEW"] = make_weekday_raw(START, 30);

    auto result = h.service.download_full("NEW", START, END);
    ASSERT_TRUE(result.ok());

    auto daily = h.daily("NEW");
    EXPECT_EQ(daily.indicators.count("SMA_20"), 1u);
    EXPECT_EQ(daily.indicators.count("SMA_50"), 0u);
    EXPECT_EQ(daily.indicators.count("ADX_14"), 1u);
    EXPECT_EQ(daily.indicators.count("MACD"), 0u);
}

TEST(FullDownloadTest, UnknownSymbolIsNotFound) {
    Harness h;
    auto result = h.service.download_full("ZZZZ", START, END);

    EXPECT_EQ(result.status, SyncResult::Status::NotFound);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(h.store.size(), 0u);
}

TEST(FullDownloadTest, ProviderFailureIsReported) {
    Harness h;
    h.provider.failing.insert("AAPL");

    auto result = h.service.download_full("AAPL", START, END);
    EXPECT_EQ(result.status, SyncResult::Status::Error);
    EXPECT_NE(result.message.find("provider unavailable"), std::string::npos);
    EXPECT_FALSE(h.store.exists(StoragePaths::daily("AAPL")));
}

TEST(FullDownloadTest, InvalidRowsBecomeWarnings) {
    Harness h;
    auto raw = make_weekday_raw(START, 25);
    raw[3].volume = -1.0;
    raw[4].low = raw[4].close + 5.0;
    h.provider.bars["AAPL"] = raw;

    auto result = h.service.download_full("AAPL", START, END);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.daily_records, 23);
    EXPECT_GE(result.warnings.size(), 2u);
}

TEST(FullDownloadTest, StorageFailureIsAnError) {
    Harness h;
    h.provider.bars["AAPL"] = make_weekday_raw(START, 10);
    h.store.failing_writes.insert(StoragePaths::daily("AAPL"));

    auto result = h.service.download_full("AAPL", START, END);
    EXPECT_EQ(result.status, SyncResult::Status::Error);
    EXPECT_NE(result.message.find("stock-data/daily/AAPL.json"), std::string::npos);
    EXPECT_FALSE(h.service.catalog().load().find("AAPL").has_value());
}

TEST(FullDownloadTest, ReversedRangeIsRejected) {
    Harness h;
    auto result = h.service.download_full("AAPL", END, START);
    EXPECT_EQ(result.status, SyncResult::Status::Error);
    EXPECT_TRUE(h.provider.calls.empty());
}

TEST(FullDownloadTest, IndicatorsCanBeDisabled) {
    Config cfg;
    cfg.indicators.enabled = false;
    Harness h(cfg);
    h.provider.bars["AAPL"] = make_weekday_raw(START, 60);

    auto result = h.service.download_full("AAPL", START, END);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.indicators.empty());
    EXPECT_TRUE(h.daily("AAPL").indicators.empty());
}


// ========== Incremental Update Tests ==========

TEST(IncrementalTest, MergesRecentWindow) {
    Harness h;
    Date today = Date::today();
    h.provider.bars["SPY"] = make_daily_raw(today - 100, today - 3);
    ASSERT_TRUE(h.service.download_full("SPY", today - 100, today).ok());

    h.provider.bars["SPY"] = make_daily_raw(today - 100, today - 1);
    auto result = h.service.update_incremental("SPY");

    ASSERT_EQ(result.status, SyncResult::Status::Success) << result.message;
    EXPECT_EQ(result.new_points, 2);
    EXPECT_EQ(result.duplicates, 2);
    EXPECT_EQ(result.overwrites, 0);
    EXPECT_EQ(result.daily_records, 100);

    const auto& call = h.provider.calls.back();
    EXPECT_EQ(call.start, today - 4);
    EXPECT_EQ(call.end, today + 1);

    EXPECT_EQ(h.daily("SPY").range_end, today - 1);
    EXPECT_EQ(h.service.catalog().load().find("SPY")->end_date, today - 1);
}

TEST(IncrementalTest, NothingNewIsReported) {
    Harness h;
    Date today = Date::today();
    h.provider.bars["SPY"] = make_daily_raw(today - 40, today - 1);
    ASSERT_TRUE(h.service.download_full("SPY", today - 40, today).ok());
    size_t writes = h.store.writes.size();

    auto result = h.service.update_incremental("SPY");
    EXPECT_EQ(result.status, SyncResult::Status::NoNewData);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.new_points, 0);
    EXPECT_EQ(result.duplicates, 2);
    EXPECT_EQ(h.store.writes.size(), writes);
}

TEST(IncrementalTest, CorrectionAloneTouchesNothing) {
    Harness h;
    Date today = Date::today();
    h.provider.bars["SPY"] = make_daily_raw(today - 40, today - 1);
    ASSERT_TRUE(h.service.download_full("SPY", today - 40, today).ok());
    double stored_close = h.daily("SPY").bars.back().close;
    size_t writes = h.store.writes.size();

    h.provider.bars["SPY"].back().close += 10.0;
    h.provider.bars["SPY"].back().high += 10.0;
    auto result = h.service.update_incremental("SPY");

    EXPECT_EQ(result.status, SyncResult::Status::NoNewData) << result.message;
    EXPECT_EQ(result.overwrites, 1);
    EXPECT_EQ(result.new_points, 0);
    EXPECT_FALSE(result.warnings.empty());
    EXPECT_EQ(h.store.writes.size(), writes);
    EXPECT_DOUBLE_EQ(h.daily("SPY").bars.back().close, stored_close);
}

TEST(IncrementalTest, CorrectionIsAppliedWithNewPoints) {
    Harness h;
    Date today = Date::today();
    h.provider.bars["SPY"] = make_daily_raw(today - 40, today - 2);
    ASSERT_TRUE(h.service.download_full("SPY", today - 40, today).ok());

    h.provider.bars["SPY"] = make_daily_raw(today - 40, today - 1);
    auto& corrected = h.provider.bars["SPY"][h.provider.bars["SPY"].size() - 2];
    corrected.close += 10.0;
    corrected.high += 10.0;
    auto result = h.service.update_incremental("SPY");

    ASSERT_EQ(result.status, SyncResult::Status::Success) << result.message;
    EXPECT_EQ(result.new_points, 1);
    EXPECT_EQ(result.overwrites, 1);
    auto daily = h.daily("SPY");
    EXPECT_EQ(daily.range_end, today - 1);
    EXPECT_DOUBLE_EQ(daily.bars[daily.bars.size() - 2].close, corrected.close);
}

TEST(IncrementalTest, EmptyStoreFallsBackToFullDownload) {
    Harness h;
    Date today = Date::today();
    h.provider.bars["QQQ"] = make_daily_raw(today - 30, today - 1);

    auto result = h.service.update_incremental("QQQ");
    ASSERT_EQ(result.status, SyncResult::Status::Success) << result.message;
    EXPECT_EQ(result.daily_records, 30);

    ASSERT_EQ(h.provider.calls.size(), 1u);
    EXPECT_EQ(h.provider.calls[0].end, today);
    EXPECT_EQ(h.provider.calls[0].start, today - (20 * 365 + 5));
}


// ========== Bulk Tests ==========

TEST(BulkTest, FailuresStayIsolated) {
    Harness h(small_pool_config());
    for (const char* sym : {"AAPL", "MSFT", "SPY"}) h.provider.bars[sym] = make_weekday_raw(START, 30);
    h.provider.failing.insert("MSFT");

    auto bulk = h.service.download_bulk({"AAPL", "MSFT", "NOPE", "spy"});

    ASSERT_EQ(bulk.results.size(), 4u);
    EXPECT_EQ(bulk.results[0].status, SyncResult::Status::Success);
    EXPECT_EQ(bulk.results[1].status, SyncResult::Status::Error);
    EXPECT_EQ(bulk.results[2].status, SyncResult::Status::NotFound);
    EXPECT_EQ(bulk.results[3].status, SyncResult::Status::Success);
    EXPECT_EQ(bulk.results[3].symbol, "SPY");
    EXPECT_EQ(bulk.succeeded(), 2);
    EXPECT_EQ(bulk.failed(), 2);

    EXPECT_TRUE(h.store.exists(StoragePaths::daily("AAPL")));
    EXPECT_FALSE(h.store.exists(StoragePaths::daily("MSFT")));
}

TEST(BulkTest, IncrementalModeUpdatesEverySymbol) {
    Harness h(small_pool_config());
    Date today = Date::today();
    std::vector<std::string> symbols = {"AAPL", "MSFT", "SPY", "QQQ", "IWM"};
    for (const auto& sym : symbols) h.provider.bars[sym] = make_daily_raw(today - 20, today - 1);
    h.provider.failing.insert("QQQ");

    auto bulk = h.service.download_bulk(symbols, DownloadService::BulkMode::Incremental);

    EXPECT_EQ(bulk.succeeded(), 4);
    EXPECT_EQ(bulk.failed(), 1);
    EXPECT_EQ(bulk.results[3].status, SyncResult::Status::Error);
    EXPECT_EQ(h.service.catalog().load().symbol_count(), 4);

    json j = bulk.to_json();
    EXPECT_EQ(j["total"], 5);
    EXPECT_EQ(j["results"][0]["status"], "success");
}

TEST(BulkTest, EmptyRequest) {
    Harness h;
    auto bulk = h.service.download_bulk({});
    EXPECT_TRUE(bulk.results.empty());
    EXPECT_EQ(bulk.succeeded(), 0);
}


// ========== Weekly Sync / Delete Tests ==========

TEST(WeeklySyncTest, SkipsExistingUnlessForced) {
    Harness h;
    h.provider.bars["AAPL"] = make_weekday_raw(START, 40);
    ASSERT_TRUE(h.service.download_full("AAPL", START, END).ok());

    auto skipped = h.service.sync_weekly("AAPL");
    EXPECT_EQ(skipped.status, SyncResult::Status::Skipped);

    h.store.remove(StoragePaths::weekly("AAPL"));
    auto rebuilt = h.service.sync_weekly("AAPL");
    EXPECT_EQ(rebuilt.status, SyncResult::Status::Success);
    EXPECT_EQ(rebuilt.weekly_records, 8);

    auto forced = h.service.sync_weekly("AAPL", true);
    EXPECT_EQ(forced.status, SyncResult::Status::Success);
}

TEST(WeeklySyncTest, NoDailyDataIsNotFound) {
    Harness h;
    EXPECT_EQ(h.service.sync_weekly("AAPL", true).status, SyncResult::Status::NotFound);
}

TEST(DeleteTest, RemovesFilesAndCatalogEntry) {
    Harness h;
    h.provider.bars["AAPL"] = make_weekday_raw(START, 10);
    ASSERT_TRUE(h.service.download_full("AAPL", START, END).ok());
    h.cache.removed.clear();

    auto result = h.service.delete_symbol("aapl");
    EXPECT_EQ(result.status, SyncResult::Status::Success);
    EXPECT_FALSE(h.store.exists(StoragePaths::daily("AAPL")));
    EXPECT_FALSE(h.store.exists(StoragePaths::weekly("AAPL")));
    EXPECT_FALSE(h.service.catalog().load().find("AAPL").has_value());
    EXPECT_TRUE(h.cache.removed.count("data:daily:AAPL"));

    EXPECT_EQ(h.service.delete_symbol("AAPL").status, SyncResult::Status::NotFound);
}


// ========== Result Serialization Tests ==========

TEST(SyncResultTest, ToJson) {
    SyncResult r;
    r.status = SyncResult::Status::NoNewData;
    r.symbol = "AAPL";
    json j = r.to_json();
    EXPECT_EQ(j["status"], "no_new_data");
    EXPECT_TRUE(j["date_range"].is_null());

    r.range_start = START;
    r.range_end = END;
    EXPECT_EQ(r.to_json()["date_range"]["end"], "2024-06-28");
}


// ========== Download Request Tests ==========

TEST(DownloadRequestTest, DecodesPayload) {
    auto req = DownloadRequest::from_json(
        {{"symbol", " aapl "}, {"mode", "full"}, {"start_date", "2024-01-02"}, {"end_date", nullptr}});
    EXPECT_EQ(req.symbol, "AAPL");
    EXPECT_EQ(req.mode, "full");
    ASSERT_TRUE(req.start_date.has_value());
    EXPECT_EQ(req.start_date->iso(), "2024-01-02");
    EXPECT_FALSE(req.end_date.has_value());
    EXPECT_FALSE(req.force);
}

TEST(DownloadRequestTest, DefaultsToIncremental) {
    auto req = DownloadRequest::from_json(json::object());
    EXPECT_TRUE(req.symbol.empty());
    EXPECT_EQ(req.mode, "incremental");
}

TEST(DownloadRequestTest, WrongFieldTypesAreValidationErrors) {
    EXPECT_THROW(DownloadRequest::from_json({{"symbol", 42}}), ValidationError);
    EXPECT_THROW(DownloadRequest::from_json({{"symbol", "SPY"}, {"mode", json::array()}}), ValidationError);
    EXPECT_THROW(DownloadRequest::from_json({{"symbol", "SPY"}, {"force", "yes"}}), ValidationError);
    EXPECT_THROW(DownloadRequest::from_json({{"symbol", "SPY"}, {"start_date", "01/02/2024"}}), ValidationError);
    EXPECT_THROW(DownloadRequest::from_json(json::array()), ValidationError);
}


// ========== Rate Limiter Tests ==========

TEST(RateLimiterTest, BooksIntoNextWindow) {
    using namespace std::chrono;
    RateLimiter limiter(2, seconds(1));
    auto t0 = RateLimiter::clock::now();

    EXPECT_EQ(limiter.reserve(t0), RateLimiter::clock::duration::zero());
    EXPECT_EQ(limiter.reserve(t0), RateLimiter::clock::duration::zero());
    EXPECT_EQ(limiter.reserve(t0), duration_cast<RateLimiter::clock::duration>(seconds(1)));
    EXPECT_EQ(limiter.reserve(t0), duration_cast<RateLimiter::clock::duration>(seconds(1)));
    EXPECT_EQ(limiter.reserve(t0), duration_cast<RateLimiter::clock::duration>(seconds(2)));
}

TEST(RateLimiterTest, QuietPeriodResetsWindow) {
    using namespace std::chrono;
    RateLimiter limiter(1, seconds(1));
    auto t0 = RateLimiter::clock::now();

    EXPECT_EQ(limiter.reserve(t0), RateLimiter::clock::duration::zero());
    EXPECT_EQ(limiter.reserve(t0 + seconds(5)), RateLimiter::clock::duration::zero());
}
