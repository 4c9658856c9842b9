#pragma once

#include "indicators/base.h"

namespace sde {

/// On-balance volume from the first bar's volume; flat closes leave it unchanged.
/// Output: OBV.
struct ObvIndicator {
    OutputColumns compute(const PriceArrays& prices) const;
};

/// Chaikin money flow. Output: CMF.
struct CmfIndicator {
    int period = 20;

    OutputColumns compute(const PriceArrays& prices) const;
};

/// Simple moving average of volume. Output: Volume_SMA.
struct VolumeSmaIndicator {
    int period = 20;

    OutputColumns compute(const PriceArrays& prices) const;
};

} // namespace sde
