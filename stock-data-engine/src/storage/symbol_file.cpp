#include "storage/symbol_file.h"
#include "errors.h"
#include "json_builder.h"
#include "storage/storage_paths.h"

#include <numeric>

using json = nlohmann::json;

namespace sde {

const char* data_type_name(DataType type) {
    switch (type) {
        case DataType::Daily:  return "daily";
        case DataType::Weekly: return "weekly";
    }
    return "daily";
}

template <>
int StoredSymbolFile<DailyBar>::trading_days() const {
    return record_count();
}

template <>
int StoredSymbolFile<WeeklyBar>::trading_days() const {
    return std::accumulate(bars.begin(), bars.end(), 0,
                           [](int acc, const WeeklyBar& w) { return acc + w.trading_days; });
}

template <typename Bar>
StoredSymbolFile<Bar> make_symbol_file(const std::string& symbol,
                                       std::vector<Bar> bars,
                                       const std::string& source)
{
    StoredSymbolFile<Bar> file;
    file.symbol = normalize_symbol(symbol);
    file.last_updated = std::time(nullptr);
    file.bars = std::move(bars);
    file.source = source;
    file.refresh_range();
    return file;
}

template DailyFile make_symbol_file(const std::string&, std::vector<DailyBar>, const std::string&);
template WeeklyFile make_symbol_file(const std::string&, std::vector<WeeklyBar>, const std::string&);

namespace {

template <typename Bar>
void write_file(json& j, const StoredSymbolFile<Bar>& file) {
    json indicators = json::object();
    for (const auto& [id, series] : file.indicators) {
        indicators[id] = series;
    }

    json range = nullptr;
    if (!file.bars.empty()) {
        range = json{{"start", file.range_start}, {"end", file.range_end}};
    }

    j = json{
        {"symbol", file.symbol},
        {"data_type", data_type_name(file.data_type)},
        {"last_updated", format_timestamp(file.last_updated)},
        {"data_range", std::move(range)},
        {"record_count", file.record_count()},
        {"metadata", {{"trading_days", file.trading_days()}, {"source", file.source}}},
        {"data_points", file.bars},
        {"indicators", std::move(indicators)},
    };
}

template <typename Bar>
void read_file(const json& j, StoredSymbolFile<Bar>& file) {
    try {
        std::string type = j.value("data_type", std::string(data_type_name(file.data_type)));
        if (type != data_type_name(file.data_type)) {
            throw ValidationError("expected data_type '" + std::string(data_type_name(file.data_type)) +
                                  "', got '" + type + "'");
        }

        file.symbol = normalize_symbol(j.at("symbol").get<std::string>());
        file.last_updated = j.contains("last_updated") && j["last_updated"].is_string()
                                ? parse_timestamp(j["last_updated"].get<std::string>())
                                : 0;
        file.bars = j.at("data_points").get<std::vector<Bar>>();

        file.source.clear();
        if (j.contains("metadata") && j["metadata"].is_object()) {
            file.source = j["metadata"].value("source", std::string());
        }

        file.indicators.clear();
        if (j.contains("indicators") && j["indicators"].is_object()) {
            for (const auto& [id, body] : j["indicators"].items()) {
                file.indicators.emplace(id, body.template get<IndicatorSeries>());
            }
        }

        if (!is_chronological(file.bars)) {
            throw ValidationError("data_points for " + file.symbol + " are not strictly increasing");
        }
        file.refresh_range();
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed symbol file: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ValidationError(std::string("malformed symbol file: ") + e.what());
    }
}

} // anonymous namespace

void to_json(json& j, const DailyFile& file) { write_file(j, file); }
void from_json(const json& j, DailyFile& file) { read_file(j, file); }
void to_json(json& j, const WeeklyFile& file) { write_file(j, file); }
void from_json(const json& j, WeeklyFile& file) { read_file(j, file); }

} // namespace sde
