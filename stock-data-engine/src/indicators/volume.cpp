#include "indicators/volume.h"
#include "indicators/talib_wrapper.h"
#include <spdlog/spdlog.h>

namespace sde {

OutputColumns ObvIndicator::compute(const PriceArrays& prices) const {
    return {{"OBV", talib::obv(prices)}};
}


OutputColumns CmfIndicator::compute(const PriceArrays& prices) const {
    const int n = static_cast<int>(prices.size());
    std::vector<double> cmf(n, NaN);

    RollingSum mfv_sum, vol_sum;
    mfv_sum.init(period);
    vol_sum.init(period);

    for (int i = 0; i < n; i++) {
        double h = prices.high[i];
        double l = prices.low[i];
        double c = prices.close[i];
        double v = prices.volume[i];

        double range = h - l;
        double mfm = (range > 0.0) ? ((c - l) - (h - c)) / range : 0.0;

        mfv_sum.push(mfm * v);
        vol_sum.push(v);

        if (vol_sum.full() && vol_sum.sum() > 0.0) {
            cmf[i] = mfv_sum.sum() / vol_sum.sum();
        }
    }

    spdlog::debug("CmfIndicator: computed {} bars", n);
    return {{"CMF", std::move(cmf)}};
}


OutputColumns VolumeSmaIndicator::compute(const PriceArrays& prices) const {
    return {{"Volume_SMA", talib::sma(prices.volume, period)}};
}

} // namespace sde
