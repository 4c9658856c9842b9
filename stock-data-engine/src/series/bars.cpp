#include "series/bars.h"

#include <cmath>
#include <spdlog/spdlog.h>

namespace sde {

namespace {

double round_cents(double v) {
    return std::round(v * 100.0) / 100.0;
}

bool positive(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // anonymous namespace

std::optional<std::string> validate_bar(const DailyBar& bar) {
    if (!positive(bar.open)) return std::string("open must be > 0");
    if (!positive(bar.high)) return std::string("high must be > 0");
    if (!positive(bar.low)) return std::string("low must be > 0");
    if (!positive(bar.close)) return std::string("close must be > 0");
    if (!positive(bar.adj_close)) return std::string("adj_close must be > 0");
    if (bar.volume < 0) return std::string("volume must be >= 0");
    if (bar.high < std::max(bar.open, bar.close)) return std::string("high must be >= open and close");
    if (bar.low > std::min(bar.open, bar.close)) return std::string("low must be <= open and close");
    return std::nullopt;
}

ConversionResult convert_raw_bars(const std::vector<RawBar>& raw) {
    ConversionResult out;
    out.bars.reserve(raw.size());

    for (const auto& r : raw) {
        if (!std::isfinite(r.volume) || r.volume < 0.0) {
            out.warnings.push_back(r.date.iso() + ": dropped row, volume must be >= 0");
            out.dropped++;
            continue;
        }

        DailyBar bar;
        bar.date = r.date;
        bar.open = round_cents(r.open);
        bar.high = round_cents(r.high);
        bar.low = round_cents(r.low);
        bar.close = round_cents(r.close);
        // Providers without an adjusted series report adj_close = 0.
        bar.adj_close = (std::isfinite(r.adj_close) && r.adj_close > 0.0)
                            ? round_cents(r.adj_close)
                            : bar.close;
        bar.volume = static_cast<int64_t>(std::llround(r.volume));

        if (auto err = validate_bar(bar)) {
            out.warnings.push_back(r.date.iso() + ": dropped row, " + *err);
            out.dropped++;
            continue;
        }
        out.bars.push_back(bar);
    }

    std::stable_sort(out.bars.begin(), out.bars.end(),
                     [](const DailyBar& a, const DailyBar& b) { return a.date < b.date; });

    // Last row wins on duplicate dates.
    std::vector<DailyBar> unique;
    unique.reserve(out.bars.size());
    for (const auto& bar : out.bars) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    out.bars = std::move(unique);

    for (const auto& w : out.warnings) spdlog::warn("Bar validation: {}", w);
    spdlog::debug("Converted {} raw rows into {} bars ({} dropped)", raw.size(), out.bars.size(), out.dropped);
    return out;
}

} // namespace sde
