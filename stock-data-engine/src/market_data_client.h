#pragma once

#include "config.h"
#include "market_data_provider.h"

#include <memory>

namespace sde {

/// gRPC client for market.v1.DailyBarService.
///
/// Each fetch waits on a shared rate limiter before opening the stream and
/// runs under its own deadline.
class MarketDataClient : public MarketDataProvider {
public:
    explicit MarketDataClient(const MarketDataConfig& config);
    ~MarketDataClient() override;

    MarketDataClient(const MarketDataClient&) = delete;
    MarketDataClient& operator=(const MarketDataClient&) = delete;

    std::vector<RawBar> fetch(const std::string& symbol,
                              const Date& start,
                              const Date& end,
                              std::chrono::seconds timeout) override;

    /// Check gRPC connectivity.
    bool health_check() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sde
