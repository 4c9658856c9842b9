#pragma once

#include <string>
#include <vector>

namespace sde {

struct CacheKeys {
    static std::string latest_price(const std::string& symbol);
    static std::string recent(const std::string& symbol, int days);

    /// The only `days` values whose recent-data reads are cached, and
    /// therefore the ones all_for_symbol() clears.
    static const std::vector<int>& recent_windows();
    static std::string symbol_list();
    static std::string symbol_info(const std::string& symbol);

    /// "data:daily:AAPL", with ":<start>" / ":<end>" appended when given.
    static std::string daily(const std::string& symbol,
                             const std::string& start = "",
                             const std::string& end = "");
    static std::string weekly(const std::string& symbol,
                              const std::string& start = "",
                              const std::string& end = "");

    /// Every key written for a symbol by the read paths, plus the symbol list.
    static std::vector<std::string> all_for_symbol(const std::string& symbol);
};

} // namespace sde
