#pragma once

#include "indicators/base.h"
#include <vector>

namespace sde::talib {

/// Thin adapters over the TA-Lib C API. Every result has the length of the
/// input, NaN before TA-Lib's first output (outBegIdx) and after its last.
/// Throws std::runtime_error when TA-Lib rejects the call.

/// TA_SMA over the values from the first valid one onward.
std::vector<double> sma(const std::vector<double>& values, int period);

/// TA_TRANGE; index 0 has no prior close and stays NaN.
std::vector<double> true_range(const PriceArrays& prices);

struct Bands {
    std::vector<double> upper, middle, lower;
};

/// TA_BBANDS around an SMA, population standard deviation.
Bands bbands(const std::vector<double>& values, int period, double nb_dev);

struct Directional {
    std::vector<double> adx, plus_di, minus_di;
};

/// TA_ADX / TA_PLUS_DI / TA_MINUS_DI, Wilder smoothing.
Directional adx(const PriceArrays& prices, int period);

/// Raw stochastic %K: TA_STOCHF with a one-bar %D.
std::vector<double> fast_k(const PriceArrays& prices, int period);

/// TA_OBV, starting from the first bar's volume.
std::vector<double> obv(const PriceArrays& prices);

} // namespace sde::talib
