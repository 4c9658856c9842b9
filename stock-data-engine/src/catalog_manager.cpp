#include "catalog_manager.h"
#include "errors.h"
#include "json_builder.h"
#include "storage/storage_paths.h"

#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sde {

void DataCatalog::add_or_update(SymbolSummary summary) {
    auto it = std::lower_bound(symbols.begin(), symbols.end(), summary.symbol,
                               [](const SymbolSummary& s, const std::string& sym) { return s.symbol < sym; });
    if (it != symbols.end() && it->symbol == summary.symbol) {
        *it = std::move(summary);
    } else {
        symbols.insert(it, std::move(summary));
    }
    last_updated = std::time(nullptr);
}

bool DataCatalog::remove(const std::string& symbol) {
    auto before = symbols.size();
    symbols.erase(std::remove_if(symbols.begin(), symbols.end(),
                                 [&](const SymbolSummary& s) { return s.symbol == symbol; }),
                  symbols.end());
    last_updated = std::time(nullptr);
    return symbols.size() != before;
}

std::optional<SymbolSummary> DataCatalog::find(const std::string& symbol) const {
    for (const auto& s : symbols) {
        if (s.symbol == symbol) return s;
    }
    return std::nullopt;
}


void to_json(json& j, const SymbolSummary& s) {
    j = json{
        {"symbol", s.symbol},
        {"start_date", s.start_date},
        {"end_date", s.end_date},
        {"total_days", s.total_days},
        {"has_weekly", s.has_weekly},
        {"last_updated", format_timestamp(s.last_updated)},
    };
}

void from_json(const json& j, SymbolSummary& s) {
    j.at("symbol").get_to(s.symbol);
    j.at("start_date").get_to(s.start_date);
    j.at("end_date").get_to(s.end_date);
    j.at("total_days").get_to(s.total_days);
    s.has_weekly = j.value("has_weekly", false);
    s.last_updated = parse_timestamp(j.at("last_updated").get<std::string>());
}

void to_json(json& j, const DataCatalog& c) {
    j = json{
        {"version", c.version},
        {"last_updated", format_timestamp(c.last_updated)},
        {"symbol_count", c.symbol_count()},
        {"symbols", c.symbols},
    };
}

void from_json(const json& j, DataCatalog& c) {
    c.version = j.value("version", std::string("1.0"));
    c.last_updated = parse_timestamp(j.at("last_updated").get<std::string>());
    c.symbols = j.value("symbols", std::vector<SymbolSummary>{});
    std::sort(c.symbols.begin(), c.symbols.end(),
              [](const SymbolSummary& a, const SymbolSummary& b) { return a.symbol < b.symbol; });
}


CatalogManager::CatalogManager(BlobStore& store) : store_(store) {}


DataCatalog CatalogManager::load() const {
    auto body = store_.get_json(StoragePaths::catalog());
    if (!body) {
        spdlog::info("No catalog found, starting a new one");
        DataCatalog empty;
        empty.last_updated = std::time(nullptr);
        return empty;
    }
    try {
        return body->get<DataCatalog>();
    } catch (const std::exception& e) {
        throw ValidationError(std::string("malformed catalog: ") + e.what());
    }
}


std::optional<SymbolSummary> CatalogManager::scan_symbol(const std::string& symbol) const {
    auto daily = store_.get_json(StoragePaths::daily(symbol));
    if (!daily) return std::nullopt;

    const auto& points = daily->at("data_points");
    if (!points.is_array() || points.empty()) return std::nullopt;

    SymbolSummary s;
    s.symbol = normalize_symbol(symbol);
    s.total_days = static_cast<int>(points.size());
    s.start_date = Date::parse(points.front().at("date").get<std::string>());
    s.end_date = Date::parse(points.back().at("date").get<std::string>());
    s.has_weekly = store_.exists(StoragePaths::weekly(symbol));
    s.last_updated = parse_timestamp(daily->at("last_updated").get<std::string>());
    return s;
}


bool CatalogManager::save(DataCatalog& catalog) {
    catalog.last_updated = std::time(nullptr);
    if (!store_.put_json(StoragePaths::catalog(), json(catalog))) {
        spdlog::error("Failed to save catalog");
        return false;
    }
    return true;
}


bool CatalogManager::update_for_symbol(const std::string& symbol) {
    const std::string sym = normalize_symbol(symbol);
    try {
        DataCatalog catalog = load();

        auto summary = scan_symbol(sym);
        if (!summary) {
            catalog.remove(sym);
            spdlog::info("Removed {} from catalog (no data file found)", sym);
        } else {
            catalog.add_or_update(*summary);
            spdlog::info("Updated catalog for {} from file scan ({} days, {} .. {})",
                         sym, summary->total_days, summary->start_date.iso(), summary->end_date.iso());
        }
        return save(catalog);
    } catch (const std::exception& e) {
        spdlog::error("Error updating catalog for {}: {}", sym, e.what());
        return false;
    }
}


DataCatalog CatalogManager::rebuild() {
    spdlog::info("Rebuilding catalog from stored data...");
    DataCatalog catalog;

    for (const auto& key : store_.list(StoragePaths::daily_prefix())) {
        auto symbol = StoragePaths::extract_symbol(key);
        if (!symbol) continue;
        try {
            if (auto summary = scan_symbol(*symbol)) catalog.add_or_update(*summary);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping {} during catalog rebuild: {}", *symbol, e.what());
        }
    }

    if (!save(catalog)) throw StorageError("failed to save rebuilt catalog");
    spdlog::info("Catalog rebuilt with {} symbols", catalog.symbol_count());
    return catalog;
}

} // namespace sde
