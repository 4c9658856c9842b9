#include "indicators/momentum.h"
#include "indicators/talib_wrapper.h"
#include <spdlog/spdlog.h>

namespace sde {

OutputColumns RsiIndicator::compute(const PriceArrays& prices) const {
    const int n = static_cast<int>(prices.size());
    std::vector<double> rsi(n, NaN);

    EmaState avg_gain, avg_loss;
    avg_gain.init_alpha(1.0 / period);
    avg_loss.init_alpha(1.0 / period);

    for (int i = 0; i < n; i++) {
        // First bar has no prior close and contributes no movement.
        double diff = (i > 0) ? prices.close[i] - prices.close[i - 1] : 0.0;
        double gain = avg_gain.update(diff > 0.0 ? diff : 0.0);
        double loss = avg_loss.update(diff < 0.0 ? -diff : 0.0);

        if (i < period - 1) continue;
        if (loss == 0.0) {
            rsi[i] = 100.0;
        } else {
            rsi[i] = 100.0 - 100.0 / (1.0 + gain / loss);
        }
    }

    return {{"RSI", std::move(rsi)}};
}


OutputColumns StochIndicator::compute(const PriceArrays& prices) const {
    auto k = talib::fast_k(prices, period);
    auto d = talib::sma(k, smooth);
    spdlog::debug("StochIndicator: computed {} bars", prices.size());
    return {{"%K", std::move(k)}, {"%D", std::move(d)}};
}

} // namespace sde
