#include "indicators/indicator_sets.h"
#include "indicators/registry.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace sde {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

const std::vector<std::string>& IndicatorSetManager::default_indicators() {
    static const std::vector<std::string> ids = {
        "SMA_20", "SMA_50", "RSI_14", "MACD", "VOLUME_SMA_20", "ADX_14",
    };
    return ids;
}

const std::map<std::string, std::vector<std::string>>& IndicatorSetManager::sets() {
    static const std::map<std::string, std::vector<std::string>> named = {
        {"default", default_indicators()},
        {"chart_basic", {"SMA_20", "SMA_50", "VOLUME_SMA_20"}},
        {"chart_advanced", {"SMA_20", "SMA_50", "EMA_12", "EMA_26", "MACD", "RSI_14", "BB_20"}},
        {"chart_full", {"SMA_20", "SMA_50", "SMA_200", "EMA_12", "EMA_26", "MACD", "RSI_14",
                        "BB_20", "ADX_14", "ATR_14", "VOLUME_SMA_20", "OBV"}},
        {"scan_momentum", {"RSI_14", "MACD", "STOCH"}},
        {"scan_trend", {"ADX_14", "SMA_20", "SMA_50", "SMA_200"}},
        {"scan_volatility", {"ATR_14", "BB_20"}},
        {"scan_volume", {"OBV", "VOLUME_SMA_20", "CMF_20"}},
    };
    return named;
}

std::vector<std::string> IndicatorSetManager::set_names() {
    std::vector<std::string> names;
    for (const auto& [name, ids] : sets()) names.push_back(name);
    return names;
}

std::vector<std::string> IndicatorSetManager::resolve(const std::string& name) {
    const auto& named = sets();
    auto it = named.find(name);
    if (it != named.end()) return it->second;

    if (name == "all") {
        std::set<std::string> all;
        for (const auto& [set_name, ids] : named) all.insert(ids.begin(), ids.end());
        return {all.begin(), all.end()};
    }

    if (name.find(',') != std::string::npos) {
        std::vector<std::string> out;
        size_t start = 0;
        while (true) {
            size_t comma = name.find(',', start);
            out.push_back(trim(name.substr(start, comma == std::string::npos ? std::string::npos
                                                                              : comma - start)));
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return out;
    }

    return {name};
}

std::vector<std::string> IndicatorSetManager::validate(const std::vector<std::string>& identifiers) {
    std::vector<std::string> out;
    std::copy_if(identifiers.begin(), identifiers.end(), std::back_inserter(out),
                 [](const std::string& id) { return is_registered(id); });
    return out;
}

int IndicatorSetManager::required_periods(const std::vector<std::string>& identifiers) {
    int required = 0;
    for (const auto& id : identifiers) {
        if (!is_registered(id)) continue;
        required = std::max(required, lookup_indicator(id)->min_periods);
    }
    return required;
}

} // namespace sde
