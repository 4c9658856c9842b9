#include "market_data_client.h"
#include "errors.h"
#include "rate_limiter.h"

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "market/v1/daily_bars.grpc.pb.h"
#include "market/v1/daily_bars.pb.h"

#include <google/protobuf/timestamp.pb.h>

namespace sde {

namespace {

google::protobuf::Timestamp* make_timestamp(time_t epoch) {
    auto* ts = new google::protobuf::Timestamp();
    ts->set_seconds(epoch);
    ts->set_nanos(0);
    return ts;
}

void check_status(const grpc::Status& status, const std::string& method, std::chrono::seconds timeout) {
    if (status.ok()) return;
    if (status.error_code() == grpc::StatusCode::DEADLINE_EXCEEDED) {
        throw DataFetchError(method + " timed out after " + std::to_string(timeout.count()) + "s");
    }
    throw DataFetchError(
        method + " failed: [" + std::to_string(status.error_code()) + "] " + status.error_message());
}

} // anonymous namespace

struct MarketDataClient::Impl {
    MarketDataConfig config;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<market::v1::DailyBarService::Stub> stub;
    RateLimiter limiter;

    explicit Impl(const MarketDataConfig& cfg)
        : config(cfg),
          limiter(cfg.rate_limit_calls, std::chrono::seconds(cfg.rate_limit_period_seconds))
    {
        channel = grpc::CreateChannel(config.target, grpc::InsecureChannelCredentials());
        stub = market::v1::DailyBarService::NewStub(channel);
        spdlog::info("MarketDataClient connected to {}", config.target);
    }
};

MarketDataClient::MarketDataClient(const MarketDataConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

MarketDataClient::~MarketDataClient() = default;


std::vector<RawBar> MarketDataClient::fetch(const std::string& symbol,
                                            const Date& start,
                                            const Date& end,
                                            std::chrono::seconds timeout)
{
    impl_->limiter.acquire();

    market::v1::StreamDailyBarsRequest req;
    req.set_symbol(symbol);
    req.set_allocated_start(make_timestamp(start.to_epoch()));
    req.set_allocated_end(make_timestamp(end.to_epoch()));

    grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);

    auto reader = impl_->stub->StreamDailyBars(&ctx, req);

    std::vector<RawBar> bars;
    market::v1::DailyBar pb_bar;

    while (reader->Read(&pb_bar)) {
        RawBar bar;
        bar.date = Date::from_epoch(pb_bar.date().seconds());
        bar.open = pb_bar.open();
        bar.high = pb_bar.high();
        bar.low = pb_bar.low();
        bar.close = pb_bar.close();
        bar.adj_close = pb_bar.adj_close();
        bar.volume = static_cast<double>(pb_bar.volume());
        bars.push_back(bar);
    }

    auto status = reader->Finish();
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        spdlog::warn("Provider has no data for {}", symbol);
        return {};
    }
    check_status(status, "StreamDailyBars(" + symbol + ")", timeout);

    spdlog::debug("Fetched {} bars for {} [{} .. {}]", bars.size(), symbol, start.iso(), end.iso());
    return bars;
}


bool MarketDataClient::health_check() const {
    auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
    return impl_->channel->WaitForConnected(deadline);
}

} // namespace sde
