#pragma once

#include "indicators/models.h"
#include "series/bars.h"

#include <ctime>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sde {

enum class DataType { Daily, Weekly };

const char* data_type_name(DataType type);

template <typename Bar> struct BarTraits;

template <> struct BarTraits<DailyBar> {
    static constexpr DataType type = DataType::Daily;
};

template <> struct BarTraits<WeeklyBar> {
    static constexpr DataType type = DataType::Weekly;
};

/// The persisted unit: one symbol's full series plus indicator annotations.
template <typename Bar>
struct StoredSymbolFile {
    static constexpr DataType data_type = BarTraits<Bar>::type;

    std::string symbol;          // upper case
    time_t last_updated = 0;     // UTC epoch seconds
    Date range_start;
    Date range_end;
    std::vector<Bar> bars;
    std::map<std::string, IndicatorSeries> indicators;
    std::string source;

    int record_count() const { return static_cast<int>(bars.size()); }

    /// Daily: number of bars. Weekly: sum of the weeks' trading days.
    int trading_days() const;

    bool empty() const { return bars.empty(); }

    /// Sets the data range from the first and last bar.
    void refresh_range() {
        if (bars.empty()) return;
        range_start = bar_date(bars.front());
        range_end = bar_date(bars.back());
    }
};

template <> int StoredSymbolFile<DailyBar>::trading_days() const;
template <> int StoredSymbolFile<WeeklyBar>::trading_days() const;

using DailyFile = StoredSymbolFile<DailyBar>;
using WeeklyFile = StoredSymbolFile<WeeklyBar>;

/// New file stamped with the current time. Bars must be chronological.
template <typename Bar>
StoredSymbolFile<Bar> make_symbol_file(const std::string& symbol,
                                       std::vector<Bar> bars,
                                       const std::string& source);

// JSON codec. from_json throws ValidationError on a malformed document or
// a data_type that does not match the target type.
void to_json(nlohmann::json& j, const DailyFile& file);
void from_json(const nlohmann::json& j, DailyFile& file);
void to_json(nlohmann::json& j, const WeeklyFile& file);
void from_json(const nlohmann::json& j, WeeklyFile& file);

} // namespace sde
