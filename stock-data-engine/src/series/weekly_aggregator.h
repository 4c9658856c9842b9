#pragma once

#include "series/bars.h"

#include <vector>

namespace sde {

struct WeekWindow {
    Date start;
    Date end;
};

/// Roll daily bars up into Monday-Friday weekly bars.
///
/// Weeks without any daily bar never appear; holiday weeks simply carry
/// fewer trading_days. None of the operations throw.
struct WeeklyAggregator {
    /// Monday and Friday of the week containing `date`.
    static WeekWindow week_boundaries(const Date& date);

    /// Input need not be sorted: bars are ordered by date before grouping so
    /// that open/close come from the first/last trading day of each week.
    std::vector<WeeklyBar> aggregate_to_weekly(const std::vector<DailyBar>& daily) const;

    /// Aggregate one week's bars (non-empty) into a single weekly bar.
    WeeklyBar aggregate_week(std::vector<DailyBar> week,
                             const Date& week_start,
                             const Date& week_end) const;

    /// Week windows covering [start, end]; the first and last windows are
    /// clipped to the range, interior windows are full Monday-Friday.
    std::vector<WeekWindow> partial_week_boundaries(const Date& start, const Date& end) const;
};

} // namespace sde
