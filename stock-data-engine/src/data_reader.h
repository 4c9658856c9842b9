#pragma once

#include "cache/cache.h"
#include "catalog_manager.h"
#include "config.h"
#include "storage/blob_store.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sde {

/// Read side over stored symbol files, read-through cached.
///
/// The cache is never the source of truth; a cache failure degrades to a
/// direct storage read. NotFoundError when nothing is stored for a symbol.
class DataReader {
public:
    DataReader(const Config& config, BlobStore& store, Cache& cache);

    /// Stored daily file as JSON. `indicator_set` (set name, "all", comma list
    /// or single id; empty = keep all) restricts the indicator map; start/end
    /// restrict bars and indicator points. Only unfiltered reads are cached.
    nlohmann::json get_daily(const std::string& symbol,
                             const std::string& indicator_set = "",
                             std::optional<Date> start = std::nullopt,
                             std::optional<Date> end = std::nullopt);

    nlohmann::json get_weekly(const std::string& symbol,
                              const std::string& indicator_set = "",
                              std::optional<Date> start = std::nullopt,
                              std::optional<Date> end = std::nullopt);

    /// {symbol, date, price, open, high, low, volume, change, change_percent}
    nlohmann::json latest_price(const std::string& symbol);

    /// Daily bars dated within the last `days` calendar days. Cached only for
    /// CacheKeys::recent_windows().
    nlohmann::json recent(const std::string& symbol, int days = 300);

    /// Catalog entry for one symbol.
    nlohmann::json symbol_info(const std::string& symbol);

    /// Symbols with a stored daily file, sorted.
    std::vector<std::string> list_symbols();

    DataCatalog catalog();

private:
    const Config& config_;
    BlobStore& store_;
    Cache& cache_;
    CatalogManager catalog_;

    template <typename File>
    nlohmann::json read_series(const char* kind, const std::string& symbol,
                               const std::string& key, const std::string& cache_key,
                               const std::string& indicator_set,
                               std::optional<Date> start, std::optional<Date> end);

    nlohmann::json load_blob(const std::string& key, const std::string& symbol);

    template <typename Load>
    nlohmann::json read_through(const std::string& key, int ttl_seconds, Load&& load);
};

} // namespace sde
