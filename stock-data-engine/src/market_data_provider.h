#pragma once

#include "series/bars.h"

#include <chrono>
#include <string>
#include <vector>

namespace sde {

/// Upstream source of end-of-day bars.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    /// Raw bars for [start, end], ascending. Empty means the symbol is unknown
    /// or has no data in range. Transport failures and deadline expiry throw
    /// DataFetchError.
    virtual std::vector<RawBar> fetch(const std::string& symbol,
                                      const Date& start,
                                      const Date& end,
                                      std::chrono::seconds timeout) = 0;
};

} // namespace sde
