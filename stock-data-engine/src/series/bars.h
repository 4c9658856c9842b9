#pragma once

#include "series/date.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sde {

struct DailyBar {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double adj_close = 0.0;
    int64_t volume = 0;
};

/// One Monday-Friday week rolled up from its daily bars.
struct WeeklyBar {
    Date week_start;    // Monday
    Date week_ending;   // Friday
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double adj_close = 0.0;
    int64_t volume = 0;
    int trading_days = 0;
};

/// Provider row before validation. Volume is kept as a double so that
/// NaN / negative values can be detected and dropped.
struct RawBar {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double adj_close = 0.0;
    double volume = 0.0;
};

/// Date axis of a bar: the trading day for daily bars, the Friday for weekly.
inline const Date& bar_date(const DailyBar& bar) { return bar.date; }
inline const Date& bar_date(const WeeklyBar& bar) { return bar.week_ending; }

/// Returns the violated rule, or nothing when the bar is valid.
std::optional<std::string> validate_bar(const DailyBar& bar);

/// Strictly increasing dates, no duplicates.
template <typename Bar>
bool is_chronological(const std::vector<Bar>& series) {
    for (size_t i = 1; i < series.size(); i++) {
        if (!(bar_date(series[i - 1]) < bar_date(series[i]))) return false;
    }
    return true;
}

struct ConversionResult {
    std::vector<DailyBar> bars;
    std::vector<std::string> warnings;
    int dropped = 0;
};

/// Convert provider rows into a clean daily series: prices rounded to cents,
/// invalid rows dropped with a warning, sorted by date with the last row
/// winning on duplicate dates.
ConversionResult convert_raw_bars(const std::vector<RawBar>& raw);

} // namespace sde
