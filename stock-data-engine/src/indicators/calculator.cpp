#include "indicators/calculator.h"
#include "indicators/momentum.h"
#include "indicators/trend.h"
#include "indicators/volatility.h"
#include "indicators/volume.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace sde {

std::map<std::string, IndicatorOutcome> IndicatorCalculator::evaluate(
    const PriceArrays& prices,
    const std::vector<std::string>& identifiers) const
{
    std::map<std::string, IndicatorOutcome> outcomes;
    const int n = static_cast<int>(prices.size());

    for (const auto& id : identifiers) {
        if (outcomes.count(id)) continue;

        auto spec = lookup_indicator(id);
        if (!spec) {
            spdlog::warn("Unknown indicator: {}", id);
            outcomes.emplace(id, IndicatorOutcome::failed("unknown indicator"));
            continue;
        }

        if (n < spec->min_periods) {
            spdlog::debug("Insufficient data for {}: have {}, need {}", id, n, spec->min_periods);
            outcomes.emplace(id, IndicatorOutcome::insufficient_history(n, spec->min_periods));
            continue;
        }

        try {
            auto columns = dispatch(*spec, prices);
            outcomes.emplace(id, IndicatorOutcome::computed(to_series(*spec, prices, columns)));
        } catch (const std::exception& e) {
            spdlog::error("Error calculating {}: {}", id, e.what());
            outcomes.emplace(id, IndicatorOutcome::failed(e.what()));
        }
    }

    return outcomes;
}


std::map<std::string, IndicatorSeries> IndicatorCalculator::calculate_for_series(
    const std::vector<DailyBar>& bars,
    const std::vector<std::string>& identifiers) const
{
    return computed_only(PriceArrays(bars), identifiers);
}

std::map<std::string, IndicatorSeries> IndicatorCalculator::calculate_for_series(
    const std::vector<WeeklyBar>& bars,
    const std::vector<std::string>& identifiers) const
{
    return computed_only(PriceArrays(bars), identifiers);
}


std::map<std::string, IndicatorSeries> IndicatorCalculator::computed_only(
    const PriceArrays& prices,
    const std::vector<std::string>& identifiers) const
{
    std::map<std::string, IndicatorSeries> out;
    if (prices.empty()) return out;

    auto outcomes = evaluate(prices, identifiers);
    for (auto& [id, outcome] : outcomes) {
        if (outcome.ok()) out.emplace(id, outcome.take_series());
    }

    spdlog::debug("IndicatorCalculator: {} of {} indicators computed over {} bars",
                  out.size(), identifiers.size(), prices.size());
    return out;
}


OutputColumns IndicatorCalculator::dispatch(const IndicatorSpec& spec, const PriceArrays& prices) const {
    const auto& p = spec.params;
    switch (spec.kind) {
        case IndicatorKind::SMA:        return SmaIndicator{p.period}.compute(prices);
        case IndicatorKind::EMA:        return EmaIndicator{p.period}.compute(prices);
        case IndicatorKind::RSI:        return RsiIndicator{p.period}.compute(prices);
        case IndicatorKind::MACD:       return MacdIndicator{p.fast, p.slow, p.signal}.compute(prices);
        case IndicatorKind::BB:         return BollingerIndicator{p.period, p.std_dev}.compute(prices);
        case IndicatorKind::ADX:        return AdxIndicator{p.period}.compute(prices);
        case IndicatorKind::ATR:        return AtrIndicator{p.period}.compute(prices);
        case IndicatorKind::STOCH:      return StochIndicator{p.period, p.smooth}.compute(prices);
        case IndicatorKind::OBV:        return ObvIndicator{}.compute(prices);
        case IndicatorKind::CMF:        return CmfIndicator{p.period}.compute(prices);
        case IndicatorKind::VOLUME_SMA: return VolumeSmaIndicator{p.period}.compute(prices);
    }
    throw std::logic_error(std::string("no computation registered for ") + kind_name(spec.kind));
}


IndicatorSeries IndicatorCalculator::to_series(const IndicatorSpec& spec,
                                               const PriceArrays& prices,
                                               const OutputColumns& columns) const
{
    const size_t n = prices.size();
    for (const auto& [name, column] : columns) {
        if (column.size() != n) {
            throw std::runtime_error(spec.id + ": output '" + name + "' has " +
                                     std::to_string(column.size()) + " values for " +
                                     std::to_string(n) + " bars");
        }
    }

    IndicatorSeries s;
    s.name = spec.id;
    s.display_name = spec.display_name;
    s.category = spec.category;
    s.description = spec.description;
    s.parameters = spec.parameter_map();
    s.outputs = spec.outputs;
    s.values.resize(n);

    for (size_t i = 0; i < n; i++) {
        auto& point = s.values[i];
        point.date = prices.dates[i];
        for (const auto& [name, column] : columns) {
            double v = column[i];
            point.values[name] = is_valid(v) ? std::optional<double>(v) : std::nullopt;
        }
    }
    return s;
}

} // namespace sde
