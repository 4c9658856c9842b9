#include "series/weekly_aggregator.h"

#include <map>
#include <spdlog/spdlog.h>

namespace sde {

WeekWindow WeeklyAggregator::week_boundaries(const Date& date) {
    Date monday = date - date.weekday();
    return {monday, monday + 4};
}


std::vector<WeeklyBar> WeeklyAggregator::aggregate_to_weekly(const std::vector<DailyBar>& daily) const {
    if (daily.empty()) return {};

    std::vector<DailyBar> sorted = daily;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const DailyBar& a, const DailyBar& b) { return a.date < b.date; });

    // Keyed by Monday, so iteration order is chronological.
    std::map<Date, std::vector<DailyBar>> weeks;
    for (const auto& bar : sorted) {
        weeks[week_boundaries(bar.date).start].push_back(bar);
    }

    std::vector<WeeklyBar> weekly;
    weekly.reserve(weeks.size());
    for (auto& [monday, bars] : weeks) {
        weekly.push_back(aggregate_week(std::move(bars), monday, monday + 4));
    }

    spdlog::debug("WeeklyAggregator: {} daily bars -> {} weeks", daily.size(), weekly.size());
    return weekly;
}


WeeklyBar WeeklyAggregator::aggregate_week(std::vector<DailyBar> week,
                                           const Date& week_start,
                                           const Date& week_end) const
{
    std::stable_sort(week.begin(), week.end(),
                     [](const DailyBar& a, const DailyBar& b) { return a.date < b.date; });

    WeeklyBar w;
    w.week_start = week_start;
    w.week_ending = week_end;
    w.trading_days = static_cast<int>(week.size());
    if (week.empty()) return w;

    w.open = week.front().open;
    w.close = week.back().close;
    w.adj_close = week.back().adj_close;
    w.high = week.front().high;
    w.low = week.front().low;
    for (const auto& d : week) {
        w.high = std::max(w.high, d.high);
        w.low = std::min(w.low, d.low);
        w.volume += d.volume;
    }
    return w;
}


std::vector<WeekWindow> WeeklyAggregator::partial_week_boundaries(const Date& start, const Date& end) const {
    std::vector<WeekWindow> windows;
    Date current = start;

    while (current <= end) {
        WeekWindow week = week_boundaries(current);
        Date clipped_start = std::max(week.start, start);
        Date clipped_end = std::min(week.end, end);

        // A range starting on a weekend has nothing left of that week.
        if (clipped_start <= clipped_end) {
            windows.push_back({clipped_start, clipped_end});
        }
        current = week.end + 3;  // next Monday
    }
    return windows;
}

} // namespace sde
