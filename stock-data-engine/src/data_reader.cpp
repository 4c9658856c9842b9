#include "data_reader.h"
#include "cache/cache_keys.h"
#include "errors.h"
#include "indicators/indicator_sets.h"
#include "json_builder.h"
#include "storage/storage_paths.h"
#include "storage/symbol_file.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sde {

namespace {

bool in_range(const Date& d, const std::optional<Date>& start, const std::optional<Date>& end) {
    if (start && d < *start) return false;
    if (end && d > *end) return false;
    return true;
}

template <typename Bar>
void apply_filters(StoredSymbolFile<Bar>& file,
                   const std::string& indicator_set,
                   const std::optional<Date>& start,
                   const std::optional<Date>& end)
{
    if (!indicator_set.empty()) {
        auto wanted = IndicatorSetManager::resolve(indicator_set);
        std::set<std::string> keep(wanted.begin(), wanted.end());
        for (auto it = file.indicators.begin(); it != file.indicators.end();) {
            it = keep.count(it->first) ? std::next(it) : file.indicators.erase(it);
        }
    }

    if (!start && !end) return;

    file.bars.erase(std::remove_if(file.bars.begin(), file.bars.end(),
                                   [&](const Bar& b) { return !in_range(bar_date(b), start, end); }),
                    file.bars.end());
    for (auto& [id, series] : file.indicators) {
        auto& pts = series.values;
        pts.erase(std::remove_if(pts.begin(), pts.end(),
                                 [&](const IndicatorPoint& p) { return !in_range(p.date, start, end); }),
                  pts.end());
    }
    file.refresh_range();
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // anonymous namespace

DataReader::DataReader(const Config& config, BlobStore& store, Cache& cache)
    : config_(config), store_(store), cache_(cache), catalog_(store) {}


template <typename Load>
json DataReader::read_through(const std::string& key, int ttl_seconds, Load&& load) {
    if (auto hit = cache_.get_json(key)) return *hit;
    json value = load();
    cache_.set_json(key, value, ttl_seconds);
    return value;
}


json DataReader::load_blob(const std::string& key, const std::string& symbol) {
    auto body = store_.get_json(key);
    if (!body) throw NotFoundError("no stored data for " + symbol);
    return std::move(*body);
}


template <typename File>
json DataReader::read_series(const char* kind, const std::string& symbol,
                             const std::string& key, const std::string& cache_key,
                             const std::string& indicator_set,
                             std::optional<Date> start, std::optional<Date> end)
{
    if (start && end && *end < *start) {
        throw ValidationError("start " + start->iso() + " is after end " + end->iso());
    }

    const bool unfiltered = indicator_set.empty() && !start && !end;
    if (unfiltered) {
        return read_through(cache_key, config_.redis.ttl_recent_data,
                            [&] { return load_blob(key, symbol); });
    }

    File file = load_blob(key, symbol).template get<File>();
    apply_filters(file, indicator_set, start, end);
    spdlog::debug("Read {} {}: {} bars, {} indicators after filtering",
                  kind, symbol, file.record_count(), file.indicators.size());
    return json(file);
}


json DataReader::get_daily(const std::string& symbol, const std::string& indicator_set,
                           std::optional<Date> start, std::optional<Date> end)
{
    const std::string sym = normalize_symbol(symbol);
    return read_series<DailyFile>("daily", sym, StoragePaths::daily(sym), CacheKeys::daily(sym),
                                  indicator_set, start, end);
}


json DataReader::get_weekly(const std::string& symbol, const std::string& indicator_set,
                            std::optional<Date> start, std::optional<Date> end)
{
    const std::string sym = normalize_symbol(symbol);
    return read_series<WeeklyFile>("weekly", sym, StoragePaths::weekly(sym), CacheKeys::weekly(sym),
                                   indicator_set, start, end);
}


json DataReader::latest_price(const std::string& symbol) {
    const std::string sym = normalize_symbol(symbol);
    return read_through(CacheKeys::latest_price(sym), config_.redis.ttl_latest_price, [&] {
        auto file = load_blob(StoragePaths::daily(sym), sym).get<DailyFile>();
        if (file.empty()) throw NotFoundError("no stored data for " + sym);

        const DailyBar& last = file.bars.back();
        json out = {
            {"symbol", sym},
            {"date", last.date.iso()},
            {"price", last.close},
            {"open", last.open},
            {"high", last.high},
            {"low", last.low},
            {"volume", last.volume},
            {"change", nullptr},
            {"change_percent", nullptr},
        };
        if (file.bars.size() >= 2) {
            double prev = file.bars[file.bars.size() - 2].close;
            double change = last.close - prev;
            out["change"] = round2(change);
            out["change_percent"] = prev > 0.0 ? round2(change / prev * 100.0) : 0.0;
        }
        return out;
    });
}


json DataReader::recent(const std::string& symbol, int days) {
    const std::string sym = normalize_symbol(symbol);
    if (days <= 0) throw ValidationError("days must be positive");

    auto load = [&] {
        auto file = load_blob(StoragePaths::daily(sym), sym).get<DailyFile>();
        Date cutoff = Date::today() - days;

        std::vector<DailyBar> bars;
        std::copy_if(file.bars.begin(), file.bars.end(), std::back_inserter(bars),
                     [&](const DailyBar& b) { return b.date >= cutoff; });

        return json{
            {"symbol", sym},
            {"days", days},
            {"record_count", bars.size()},
            {"data_points", bars},
        };
    };

    // Other windows are never invalidated after a write, so they skip the cache.
    const auto& windows = CacheKeys::recent_windows();
    if (std::find(windows.begin(), windows.end(), days) == windows.end()) return load();
    return read_through(CacheKeys::recent(sym, days), config_.redis.ttl_recent_data, load);
}


json DataReader::symbol_info(const std::string& symbol) {
    const std::string sym = normalize_symbol(symbol);
    return read_through(CacheKeys::symbol_info(sym), config_.redis.ttl_symbol_info, [&] {
        auto entry = catalog_.load().find(sym);
        if (!entry) throw NotFoundError("no catalog entry for " + sym);
        return json(*entry);
    });
}


std::vector<std::string> DataReader::list_symbols() {
    json cached = read_through(CacheKeys::symbol_list(), config_.redis.ttl_symbol_list, [&] {
        std::vector<std::string> symbols;
        for (const auto& key : store_.list(StoragePaths::daily_prefix())) {
            if (auto sym = StoragePaths::extract_symbol(key)) symbols.push_back(*sym);
        }
        std::sort(symbols.begin(), symbols.end());
        return json(symbols);
    });

    try {
        return cached.get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring malformed cached symbol list: {}", e.what());
        cache_.remove(CacheKeys::symbol_list());
        return list_symbols();
    }
}


DataCatalog DataReader::catalog() {
    return catalog_.load();
}

} // namespace sde
