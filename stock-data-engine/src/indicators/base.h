#pragma once

#include "series/bars.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace sde {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Column view of a price series, the input to every indicator.
/// Bars are ordered by their date axis (weekly bars use week_ending).
struct PriceArrays {
    std::vector<Date> dates;
    std::vector<double> open, high, low, close, volume;

    PriceArrays() = default;
    explicit PriceArrays(const std::vector<DailyBar>& bars) { fill(bars); }
    explicit PriceArrays(const std::vector<WeeklyBar>& bars) { fill(bars); }

    size_t size() const { return dates.size(); }
    bool empty() const { return dates.empty(); }

private:
    template <typename Bar>
    void fill(std::vector<Bar> bars) {
        std::stable_sort(bars.begin(), bars.end(),
                         [](const Bar& a, const Bar& b) { return bar_date(a) < bar_date(b); });
        const size_t n = bars.size();
        dates.reserve(n);
        open.reserve(n);
        high.reserve(n);
        low.reserve(n);
        close.reserve(n);
        volume.reserve(n);
        for (const auto& b : bars) {
            dates.push_back(bar_date(b));
            open.push_back(b.open);
            high.push_back(b.high);
            low.push_back(b.low);
            close.push_back(b.close);
            volume.push_back(static_cast<double>(b.volume));
        }
    }
};

/// Named output columns of one indicator, each the length of the input.
using OutputColumns = std::vector<std::pair<std::string, std::vector<double>>>;

// ---------------------------------------------------------------------------
// Math utilities
// ---------------------------------------------------------------------------

inline bool is_valid(double v) {
    return std::isfinite(v);
}

/// Exponential moving average (recursive, non-adjusted form).
/// Seeded with the first valid observation.
struct EmaState {
    double value = NaN;
    double alpha = 0.0;
    int count = 0;

    /// alpha = 2.0 / (span + 1)
    void init(int span) { init_alpha(2.0 / (span + 1.0)); }

    /// Wilder smoothing uses alpha = 1 / period.
    void init_alpha(double a) {
        alpha = a;
        count = 0;
        value = NaN;
    }

    double update(double x) {
        if (!is_valid(x)) return value;
        if (count == 0) {
            value = x;
        } else {
            value = alpha * x + (1.0 - alpha) * value;
        }
        count++;
        return value;
    }
};

/// Rolling sum helper
struct RollingSum {
    std::vector<double> buf;
    int window = 0;
    int pos = 0;
    int count = 0;
    double total = 0.0;

    void init(int w) {
        window = w;
        buf.assign(w, 0.0);
        pos = 0;
        count = 0;
        total = 0.0;
    }

    void push(double x) {
        if (count >= window) {
            total -= buf[pos];
        } else {
            count++;
        }
        buf[pos] = x;
        total += x;
        pos = (pos + 1) % window;
    }

    bool full() const { return count >= window; }
    double sum() const { return total; }
    double mean() const { return count > 0 ? total / count : NaN; }
};

/// EMA with the given alpha over the valid values of `values`, seeded at the
/// first valid one. NaN until `min_periods` valid values have been seen.
inline std::vector<double> ema_series(const std::vector<double>& values, double alpha, int min_periods) {
    std::vector<double> out(values.size(), NaN);
    EmaState ema;
    ema.init_alpha(alpha);
    for (size_t i = 0; i < values.size(); i++) {
        if (!is_valid(values[i])) continue;
        double v = ema.update(values[i]);
        if (ema.count >= min_periods) out[i] = v;
    }
    return out;
}

} // namespace sde
