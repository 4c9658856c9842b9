#include "indicators/trend.h"
#include "indicators/talib_wrapper.h"
#include <spdlog/spdlog.h>

namespace sde {

OutputColumns SmaIndicator::compute(const PriceArrays& prices) const {
    return {{"SMA", talib::sma(prices.close, period)}};
}


OutputColumns EmaIndicator::compute(const PriceArrays& prices) const {
    return {{"EMA", ema_series(prices.close, 2.0 / (period + 1.0), period)}};
}


OutputColumns MacdIndicator::compute(const PriceArrays& prices) const {
    const size_t n = prices.size();

    auto fast_ema = ema_series(prices.close, 2.0 / (fast + 1.0), fast);
    auto slow_ema = ema_series(prices.close, 2.0 / (slow + 1.0), slow);

    std::vector<double> macd(n, NaN);
    for (size_t i = 0; i < n; i++) {
        if (is_valid(fast_ema[i]) && is_valid(slow_ema[i])) {
            macd[i] = fast_ema[i] - slow_ema[i];
        }
    }

    // Signal line starts at the first MACD value.
    auto sig = ema_series(macd, 2.0 / (signal + 1.0), signal);

    std::vector<double> hist(n, NaN);
    for (size_t i = 0; i < n; i++) {
        if (is_valid(macd[i]) && is_valid(sig[i])) hist[i] = macd[i] - sig[i];
    }

    return {{"MACD", std::move(macd)}, {"signal", std::move(sig)}, {"histogram", std::move(hist)}};
}


OutputColumns AdxIndicator::compute(const PriceArrays& prices) const {
    auto d = talib::adx(prices, period);
    spdlog::debug("AdxIndicator: computed {} bars", prices.size());
    return {{"ADX", std::move(d.adx)}, {"DI+", std::move(d.plus_di)}, {"DI-", std::move(d.minus_di)}};
}

} // namespace sde
