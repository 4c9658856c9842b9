#include "cache/cache_keys.h"
#include "storage/storage_paths.h"

namespace sde {

namespace {

std::string series_key(const char* type, const std::string& symbol,
                       const std::string& start, const std::string& end)
{
    std::string key = std::string("data:") + type + ":" + normalize_symbol(symbol);
    if (!start.empty()) key += ":" + start;
    if (!end.empty()) key += ":" + end;
    return key;
}

} // anonymous namespace

std::string CacheKeys::latest_price(const std::string& symbol) {
    return "price:latest:" + normalize_symbol(symbol);
}

std::string CacheKeys::recent(const std::string& symbol, int days) {
    return "data:recent:" + normalize_symbol(symbol) + ":" + std::to_string(days);
}

const std::vector<int>& CacheKeys::recent_windows() {
    static const std::vector<int> windows = {300, 30};
    return windows;
}

std::string CacheKeys::symbol_list() {
    return "symbols:list";
}

std::string CacheKeys::symbol_info(const std::string& symbol) {
    return "symbol:info:" + normalize_symbol(symbol);
}

std::string CacheKeys::daily(const std::string& symbol, const std::string& start, const std::string& end) {
    return series_key("daily", symbol, start, end);
}

std::string CacheKeys::weekly(const std::string& symbol, const std::string& start, const std::string& end) {
    return series_key("weekly", symbol, start, end);
}

std::vector<std::string> CacheKeys::all_for_symbol(const std::string& symbol) {
    std::vector<std::string> keys = {
        daily(symbol),
        weekly(symbol),
        latest_price(symbol),
    };
    for (int days : recent_windows()) keys.push_back(recent(symbol, days));
    keys.push_back(symbol_info(symbol));
    keys.push_back(symbol_list());
    return keys;
}

} // namespace sde
