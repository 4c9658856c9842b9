#include "indicators/talib_wrapper.h"

#include <stdexcept>
#include <string>
#include <ta-lib/ta_libc.h>

namespace sde::talib {

namespace {

// TA_Initialize once per process; the function calls themselves keep no state.
void ensure_initialized() {
    static const TA_RetCode rc = TA_Initialize();
    if (rc != TA_SUCCESS) {
        throw std::runtime_error("TA_Initialize failed: " + std::to_string(rc));
    }
}

void check(TA_RetCode rc, const char* func) {
    if (rc != TA_SUCCESS) {
        throw std::runtime_error(std::string(func) + " failed: " + std::to_string(rc));
    }
}

// Spread TA-Lib's compact output back onto the input's index space.
// `offset` is where the input handed to TA-Lib started.
std::vector<double> place(const std::vector<double>& out, size_t n, int offset, int out_beg, int out_nb) {
    std::vector<double> full(n, NaN);
    for (int i = 0; i < out_nb; i++) {
        full[offset + out_beg + i] = out[i];
    }
    return full;
}

int first_valid(const std::vector<double>& values) {
    for (size_t i = 0; i < values.size(); i++) {
        if (is_valid(values[i])) return static_cast<int>(i);
    }
    return -1;
}

} // anonymous namespace


std::vector<double> sma(const std::vector<double>& values, int period) {
    ensure_initialized();
    const int n = static_cast<int>(values.size());
    const int first = first_valid(values);
    if (first < 0) return std::vector<double>(n, NaN);

    std::vector<double> out(n);
    int out_beg = 0, out_nb = 0;
    check(TA_SMA(0, n - first - 1, values.data() + first, period, &out_beg, &out_nb, out.data()),
          "TA_SMA");
    return place(out, n, first, out_beg, out_nb);
}


std::vector<double> true_range(const PriceArrays& prices) {
    ensure_initialized();
    const int n = static_cast<int>(prices.size());
    if (n == 0) return {};

    std::vector<double> out(n);
    int out_beg = 0, out_nb = 0;
    check(TA_TRANGE(0, n - 1, prices.high.data(), prices.low.data(), prices.close.data(),
                    &out_beg, &out_nb, out.data()),
          "TA_TRANGE");
    return place(out, n, 0, out_beg, out_nb);
}


Bands bbands(const std::vector<double>& values, int period, double nb_dev) {
    ensure_initialized();
    const int n = static_cast<int>(values.size());
    if (n == 0) return {};

    std::vector<double> upper(n), middle(n), lower(n);
    int out_beg = 0, out_nb = 0;
    check(TA_BBANDS(0, n - 1, values.data(), period, nb_dev, nb_dev, TA_MAType_SMA,
                    &out_beg, &out_nb, upper.data(), middle.data(), lower.data()),
          "TA_BBANDS");
    return {place(upper, n, 0, out_beg, out_nb),
            place(middle, n, 0, out_beg, out_nb),
            place(lower, n, 0, out_beg, out_nb)};
}


Directional adx(const PriceArrays& prices, int period) {
    ensure_initialized();
    const int n = static_cast<int>(prices.size());
    if (n == 0) return {};

    const double* h = prices.high.data();
    const double* l = prices.low.data();
    const double* c = prices.close.data();
    std::vector<double> out(n);
    int out_beg = 0, out_nb = 0;
    Directional d;

    check(TA_ADX(0, n - 1, h, l, c, period, &out_beg, &out_nb, out.data()), "TA_ADX");
    d.adx = place(out, n, 0, out_beg, out_nb);

    check(TA_PLUS_DI(0, n - 1, h, l, c, period, &out_beg, &out_nb, out.data()), "TA_PLUS_DI");
    d.plus_di = place(out, n, 0, out_beg, out_nb);

    check(TA_MINUS_DI(0, n - 1, h, l, c, period, &out_beg, &out_nb, out.data()), "TA_MINUS_DI");
    d.minus_di = place(out, n, 0, out_beg, out_nb);

    return d;
}


std::vector<double> fast_k(const PriceArrays& prices, int period) {
    ensure_initialized();
    const int n = static_cast<int>(prices.size());
    if (n == 0) return {};

    std::vector<double> k(n), d(n);
    int out_beg = 0, out_nb = 0;
    check(TA_STOCHF(0, n - 1, prices.high.data(), prices.low.data(), prices.close.data(),
                    period, 1, TA_MAType_SMA, &out_beg, &out_nb, k.data(), d.data()),
          "TA_STOCHF");
    return place(k, n, 0, out_beg, out_nb);
}


std::vector<double> obv(const PriceArrays& prices) {
    ensure_initialized();
    const int n = static_cast<int>(prices.size());
    if (n == 0) return {};

    std::vector<double> out(n);
    int out_beg = 0, out_nb = 0;
    check(TA_OBV(0, n - 1, prices.close.data(), prices.volume.data(), &out_beg, &out_nb, out.data()),
          "TA_OBV");
    return place(out, n, 0, out_beg, out_nb);
}

} // namespace sde::talib
