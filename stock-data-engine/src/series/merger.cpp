#include "series/merger.h"

#include <cmath>
#include <map>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace sde {

namespace {

double relative_diff(double old_value, double new_value) {
    if (old_value == 0.0) {
        return new_value == 0.0 ? 0.0 : INFINITY;
    }
    return std::abs(new_value - old_value) / std::abs(old_value);
}

} // anonymous namespace

bool IncrementalMerger::is_significant_change(const DailyBar& old_bar, const DailyBar& new_bar) const {
    double price_diff = relative_diff(old_bar.close, new_bar.close);
    double volume_diff = relative_diff(static_cast<double>(old_bar.volume),
                                       static_cast<double>(new_bar.volume));
    return price_diff > policy_.price_threshold || volume_diff > policy_.volume_threshold;
}


MergeResult IncrementalMerger::merge(const std::vector<DailyBar>& existing,
                                     const std::vector<DailyBar>& incoming) const
{
    MergeResult result;
    auto& stats = result.stats;

    std::map<Date, DailyBar> by_date;
    for (const auto& bar : existing) {
        by_date[bar.date] = bar;
    }

    for (const auto& bar : incoming) {
        auto it = by_date.find(bar.date);
        if (it == by_date.end()) {
            by_date.emplace(bar.date, bar);
            stats.new_points++;
            continue;
        }

        if (is_significant_change(it->second, bar)) {
            stats.warnings.push_back(fmt::format(
                "{}: close {} -> {}, volume {} -> {} (overwritten)",
                bar.date.iso(), it->second.close, bar.close, it->second.volume, bar.volume));
            spdlog::warn("Merge conflict: {}", stats.warnings.back());
            it->second = bar;
            stats.overwrites++;
        } else {
            stats.duplicates++;
        }
    }

    result.merged.reserve(by_date.size());
    for (const auto& [date, bar] : by_date) {
        result.merged.push_back(bar);
    }

    auto gaps = find_gaps(result.merged);
    stats.warnings.insert(stats.warnings.end(), gaps.begin(), gaps.end());

    spdlog::debug("Merge: {} existing + {} incoming -> {} bars (new={}, dup={}, overwritten={})",
                  existing.size(), incoming.size(), result.merged.size(),
                  stats.new_points, stats.duplicates, stats.overwrites);
    return result;
}


std::vector<std::string> IncrementalMerger::find_gaps(const std::vector<DailyBar>& series) const {
    std::vector<std::string> out;
    int found = 0;
    for (size_t i = 1; i < series.size(); i++) {
        int gap = series[i].date - series[i - 1].date;
        if (gap <= policy_.gap_days) continue;
        found++;
        if (found <= policy_.max_gap_warnings) {
            out.push_back(fmt::format("gap of {} days between {} and {}",
                                      gap, series[i - 1].date.iso(), series[i].date.iso()));
        }
    }
    if (found > policy_.max_gap_warnings) {
        out.push_back(fmt::format("{} more gaps not reported", found - policy_.max_gap_warnings));
    }
    return out;
}

} // namespace sde
