#pragma once

#include "series/date.h"
#include "storage/blob_store.h"

#include <ctime>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sde {

struct SymbolSummary {
    std::string symbol;
    Date start_date;
    Date end_date;
    int total_days = 0;
    bool has_weekly = false;
    time_t last_updated = 0;
};

struct DataCatalog {
    std::string version = "1.0";
    time_t last_updated = 0;
    std::vector<SymbolSummary> symbols;   // sorted by symbol

    int symbol_count() const { return static_cast<int>(symbols.size()); }

    void add_or_update(SymbolSummary summary);
    bool remove(const std::string& symbol);
    std::optional<SymbolSummary> find(const std::string& symbol) const;
};

void to_json(nlohmann::json& j, const SymbolSummary& s);
void from_json(const nlohmann::json& j, SymbolSummary& s);
void to_json(nlohmann::json& j, const DataCatalog& c);
void from_json(const nlohmann::json& j, DataCatalog& c);

/// Maintains stock-data/metadata/catalog.json.
///
/// Entries are always derived from the persisted daily blob, read back from
/// the store after it was written, never from a caller's in-memory copy.
/// That keeps catalog and storage from diverging.
class CatalogManager {
public:
    explicit CatalogManager(BlobStore& store);

    /// Stored catalog, or an empty one when none exists yet.
    /// Throws StorageError when the store cannot be read.
    DataCatalog load() const;

    /// Rescan one symbol's daily blob and save the catalog. A symbol without
    /// a daily blob is removed from it. Returns false on failure (logged).
    bool update_for_symbol(const std::string& symbol);

    /// Rebuild from a scan of every daily blob and save it.
    DataCatalog rebuild();

private:
    BlobStore& store_;

    std::optional<SymbolSummary> scan_symbol(const std::string& symbol) const;
    bool save(DataCatalog& catalog);
};

} // namespace sde
