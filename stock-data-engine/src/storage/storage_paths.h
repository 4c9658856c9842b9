#pragma once

#include <optional>
#include <string>

namespace sde {

/// Blob key layout under the "stock-data/" root.
struct StoragePaths {
    static constexpr const char* ROOT = "stock-data";

    static std::string daily_prefix();    // "stock-data/daily/"
    static std::string weekly_prefix();   // "stock-data/weekly/"
    static std::string daily(const std::string& symbol);
    static std::string weekly(const std::string& symbol);
    static std::string catalog();

    /// "stock-data/daily/AAPL.json" -> "AAPL"; nothing for other keys.
    static std::optional<std::string> extract_symbol(const std::string& key);
};

/// Symbols are stored upper-case and trimmed.
std::string normalize_symbol(const std::string& symbol);

} // namespace sde
