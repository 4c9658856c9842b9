#include "storage/storage_paths.h"

#include <algorithm>
#include <cctype>

namespace sde {

namespace {

constexpr const char* SUFFIX = ".json";

} // anonymous namespace

std::string normalize_symbol(const std::string& symbol) {
    auto begin = symbol.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = symbol.find_last_not_of(" \t\r\n");
    std::string out = symbol.substr(begin, end - begin + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

std::string StoragePaths::daily_prefix() {
    return std::string(ROOT) + "/daily/";
}

std::string StoragePaths::weekly_prefix() {
    return std::string(ROOT) + "/weekly/";
}

std::string StoragePaths::daily(const std::string& symbol) {
    return daily_prefix() + normalize_symbol(symbol) + SUFFIX;
}

std::string StoragePaths::weekly(const std::string& symbol) {
    return weekly_prefix() + normalize_symbol(symbol) + SUFFIX;
}

std::string StoragePaths::catalog() {
    return std::string(ROOT) + "/metadata/catalog.json";
}

std::optional<std::string> StoragePaths::extract_symbol(const std::string& key) {
    const std::string suffix = SUFFIX;
    for (const auto& prefix : {daily_prefix(), weekly_prefix()}) {
        if (key.size() <= prefix.size() + suffix.size()) continue;
        if (key.compare(0, prefix.size(), prefix) != 0) continue;
        if (key.compare(key.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

        std::string symbol = key.substr(prefix.size(), key.size() - prefix.size() - suffix.size());
        if (symbol.find('/') != std::string::npos) return std::nullopt;
        return symbol;
    }
    return std::nullopt;
}

} // namespace sde
