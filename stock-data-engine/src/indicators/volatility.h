#pragma once

#include "indicators/base.h"

namespace sde {

/// Bollinger bands around SMA(period) at +/- std_dev population standard
/// deviations. Outputs: upper, middle, lower.
struct BollingerIndicator {
    int period = 20;
    double std_dev = 2.0;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Average true range as the rolling mean of true range. The first bar has no
/// true range, so ATR starts at index period. Output: ATR.
struct AtrIndicator {
    int period = 14;

    OutputColumns compute(const PriceArrays& prices) const;
};

} // namespace sde
