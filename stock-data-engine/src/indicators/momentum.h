#pragma once

#include "indicators/base.h"

namespace sde {

/// Relative strength index, Wilder smoothing. Output: RSI in [0, 100].
struct RsiIndicator {
    int period = 14;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Stochastic oscillator: raw %K over `period` bars, %D = SMA(%K, smooth).
/// A window with no high-low range gives %K = 0. Outputs: %K, %D.
struct StochIndicator {
    int period = 14;
    int smooth = 3;

    OutputColumns compute(const PriceArrays& prices) const;
};

} // namespace sde
