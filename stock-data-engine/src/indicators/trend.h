#pragma once

#include "indicators/base.h"

namespace sde {

/// Simple moving average of close. Output: SMA.
struct SmaIndicator {
    int period = 20;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Exponential moving average of close, alpha = 2/(period+1), seeded with
/// the first close. Output: EMA.
struct EmaIndicator {
    int period = 12;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Outputs: MACD, signal, histogram.
struct MacdIndicator {
    int fast = 12;
    int slow = 26;
    int signal = 9;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Average directional index (TA-Lib, Wilder smoothing). ADX starts at
/// index 2*period-1, DI+ / DI- at index period. Outputs: ADX, DI+, DI-.
struct AdxIndicator {
    int period = 14;

    OutputColumns compute(const PriceArrays& prices) const;
};

} // namespace sde
