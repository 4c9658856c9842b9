#include "indicators/registry.h"

#include <algorithm>
#include <cctype>

namespace sde {

namespace {

IndicatorParams period_params(int period) {
    IndicatorParams p;
    p.period = period;
    return p;
}

IndicatorSpec make_sma(const std::string& id, int period, int min_periods) {
    return {id, IndicatorKind::SMA, period_params(period), min_periods,
            "Simple Moving Average (" + std::to_string(period) + ")", "trend",
            std::to_string(period) + "-day simple moving average of closing prices",
            {"SMA"}};
}

IndicatorSpec make_ema(const std::string& id, int period, int min_periods) {
    return {id, IndicatorKind::EMA, period_params(period), min_periods,
            "Exponential Moving Average (" + std::to_string(period) + ")", "trend",
            std::to_string(period) + "-day exponential moving average",
            {"EMA"}};
}

std::vector<IndicatorSpec> build_catalog() {
    std::vector<IndicatorSpec> c;

    c.push_back(make_sma("SMA_20", 20, 20));
    c.push_back(make_sma("SMA_50", 50, 50));
    c.push_back(make_sma("SMA_200", 200, 200));

    // EMAs need roughly twice their span to settle.
    c.push_back(make_ema("EMA_12", 12, 25));
    c.push_back(make_ema("EMA_26", 26, 50));

    c.push_back({"RSI_14", IndicatorKind::RSI, period_params(14), 15,
                 "Relative Strength Index (14)", "momentum",
                 "14-day RSI measuring momentum", {"RSI"}});

    IndicatorParams macd;
    macd.fast = 12;
    macd.slow = 26;
    macd.signal = 9;
    c.push_back({"MACD", IndicatorKind::MACD, macd, 35,
                 "MACD (12,26,9)", "momentum",
                 "Moving Average Convergence Divergence", {"MACD", "signal", "histogram"}});

    IndicatorParams bb = period_params(20);
    bb.std_dev = 2.0;
    c.push_back({"BB_20", IndicatorKind::BB, bb, 20,
                 "Bollinger Bands (20,2)", "volatility",
                 "20-day Bollinger Bands with 2 standard deviations", {"upper", "middle", "lower"}});

    c.push_back({"ADX_14", IndicatorKind::ADX, period_params(14), 28,
                 "Average Directional Index (14)", "trend",
                 "14-day ADX measuring trend strength", {"ADX", "DI+", "DI-"}});

    c.push_back({"ATR_14", IndicatorKind::ATR, period_params(14), 15,
                 "Average True Range (14)", "volatility",
                 "14-day ATR measuring volatility", {"ATR"}});

    IndicatorParams stoch = period_params(14);
    stoch.smooth = 3;
    c.push_back({"STOCH", IndicatorKind::STOCH, stoch, 14,
                 "Stochastic Oscillator (14,3,3)", "momentum",
                 "Stochastic oscillator with standard parameters", {"%K", "%D"}});

    c.push_back({"OBV", IndicatorKind::OBV, IndicatorParams{}, 2,
                 "On Balance Volume", "volume",
                 "Cumulative volume flow indicator", {"OBV"}});

    c.push_back({"CMF_20", IndicatorKind::CMF, period_params(20), 21,
                 "Chaikin Money Flow (20)", "volume",
                 "20-day Chaikin Money Flow", {"CMF"}});

    c.push_back({"VOLUME_SMA_20", IndicatorKind::VOLUME_SMA, period_params(20), 20,
                 "Volume SMA (20)", "volume",
                 "20-day simple moving average of volume", {"Volume_SMA"}});

    return c;
}

/// Parses the <n> of "<prefix><n>"; 0 when the suffix is not a positive integer.
int parse_period_suffix(const std::string& id, const std::string& prefix) {
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) return 0;
    std::string digits = id.substr(prefix.size());
    if (digits.size() > 6) return 0;
    for (char ch : digits) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return 0;
    }
    return std::stoi(digits);
}

} // anonymous namespace

const char* kind_name(IndicatorKind kind) {
    switch (kind) {
        case IndicatorKind::SMA:        return "SMA";
        case IndicatorKind::EMA:        return "EMA";
        case IndicatorKind::RSI:        return "RSI";
        case IndicatorKind::MACD:       return "MACD";
        case IndicatorKind::BB:         return "BB";
        case IndicatorKind::ADX:        return "ADX";
        case IndicatorKind::ATR:        return "ATR";
        case IndicatorKind::STOCH:      return "STOCH";
        case IndicatorKind::OBV:        return "OBV";
        case IndicatorKind::CMF:        return "CMF";
        case IndicatorKind::VOLUME_SMA: return "VOLUME_SMA";
    }
    return "UNKNOWN";
}

std::map<std::string, double> IndicatorSpec::parameter_map() const {
    const double period = params.period;
    switch (kind) {
        case IndicatorKind::MACD:
            return {{"fast", static_cast<double>(params.fast)},
                    {"slow", static_cast<double>(params.slow)},
                    {"signal", static_cast<double>(params.signal)}};
        case IndicatorKind::BB:
            return {{"period", period}, {"std_dev", params.std_dev}};
        case IndicatorKind::STOCH:
            return {{"period", period}, {"smooth", static_cast<double>(params.smooth)}};
        case IndicatorKind::OBV:
            return {};
        case IndicatorKind::SMA:
        case IndicatorKind::EMA:
        case IndicatorKind::RSI:
        case IndicatorKind::ADX:
        case IndicatorKind::ATR:
        case IndicatorKind::CMF:
        case IndicatorKind::VOLUME_SMA:
            return {{"period", period}};
    }
    return {};
}

const std::vector<IndicatorSpec>& indicator_catalog() {
    static const std::vector<IndicatorSpec> catalog = build_catalog();
    return catalog;
}

bool is_registered(const std::string& id) {
    const auto& c = indicator_catalog();
    return std::any_of(c.begin(), c.end(), [&](const IndicatorSpec& s) { return s.id == id; });
}

std::optional<IndicatorSpec> lookup_indicator(const std::string& id) {
    for (const auto& spec : indicator_catalog()) {
        if (spec.id == id) return spec;
    }

    // TA_SMA needs a period of at least 2
    if (int n = parse_period_suffix(id, "SMA_"); n > 1) return make_sma(id, n, n);
    if (int n = parse_period_suffix(id, "EMA_"); n > 0) return make_ema(id, n, n);
    return std::nullopt;
}

} // namespace sde
