#include "indicators/volatility.h"
#include "indicators/talib_wrapper.h"
#include <spdlog/spdlog.h>

namespace sde {

OutputColumns BollingerIndicator::compute(const PriceArrays& prices) const {
    auto bands = talib::bbands(prices.close, period, std_dev);
    spdlog::debug("BollingerIndicator: computed {} bars", prices.size());
    return {{"upper", std::move(bands.upper)}, {"middle", std::move(bands.middle)}, {"lower", std::move(bands.lower)}};
}


OutputColumns AtrIndicator::compute(const PriceArrays& prices) const {
    return {{"ATR", talib::sma(talib::true_range(prices), period)}};
}

} // namespace sde
