#pragma once

#include "indicators/base.h"
#include "indicators/models.h"
#include "indicators/registry.h"

#include <map>
#include <string>
#include <vector>

namespace sde {

/// Computes catalog indicators over a price series.
///
/// Every requested identifier gets an explicit outcome: computed,
/// insufficient history (series shorter than the identifier's minimum
/// history) or failed (unknown identifier, or the computation threw).
/// One identifier's failure never affects the others.
class IndicatorCalculator {
public:
    std::map<std::string, IndicatorOutcome> evaluate(const PriceArrays& prices,
                                                     const std::vector<std::string>& identifiers) const;

    /// Computed series only, keyed by identifier.
    std::map<std::string, IndicatorSeries> calculate_for_series(const std::vector<DailyBar>& bars,
                                                                const std::vector<std::string>& identifiers) const;
    std::map<std::string, IndicatorSeries> calculate_for_series(const std::vector<WeeklyBar>& bars,
                                                                const std::vector<std::string>& identifiers) const;

private:
    std::map<std::string, IndicatorSeries> computed_only(const PriceArrays& prices,
                                                         const std::vector<std::string>& identifiers) const;

    OutputColumns dispatch(const IndicatorSpec& spec, const PriceArrays& prices) const;

    IndicatorSeries to_series(const IndicatorSpec& spec, const PriceArrays& prices,
                              const OutputColumns& columns) const;
};

} // namespace sde
