#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "indicators/base.h"
#include "indicators/calculator.h"
#include "indicators/momentum.h"
#include "indicators/registry.h"
#include "indicators/talib_wrapper.h"
#include "indicators/trend.h"
#include "indicators/volatility.h"
#include "indicators/volume.h"
#include "series/weekly_aggregator.h"

using namespace sde;

namespace {

// Daily bars on consecutive days from 2024-01-01, slow uptrend with a
// zig-zag so that both gains and losses occur.
std::vector<DailyBar> make_bars(int n, double base_price = 100.0) {
    std::vector<DailyBar> bars(n);
    Date start = Date::from_ymd(2024, 1, 1);
    for (int i = 0; i < n; i++) {
        double price = base_price + i * 0.1 + (i % 2 == 0 ? 0.3 : -0.3);
        bars[i].date = start + i;
        bars[i].open = price - 0.05;
        bars[i].high = price + 0.5;
        bars[i].low = price - 0.5;
        bars[i].close = price;
        bars[i].adj_close = price;
        bars[i].volume = 1000 + i * 10;
    }
    return bars;
}

// Closes strictly increasing by 1.
std::vector<DailyBar> make_rising_bars(int n) {
    auto bars = make_bars(n);
    for (int i = 0; i < n; i++) {
        double price = 50.0 + i;
        bars[i].open = price;
        bars[i].close = price;
        bars[i].adj_close = price;
        bars[i].high = price + 0.5;
        bars[i].low = price - 0.5;
    }
    return bars;
}

const std::vector<double>& column(const OutputColumns& cols, const std::string& name) {
    for (const auto& [n, values] : cols) {
        if (n == name) return values;
    }
    throw std::out_of_range("no column " + name);
}

} // anonymous namespace


// ========== Base Math Tests ==========

TEST(BaseTest, EmaState) {
    EmaState ema;
    ema.init(3);

    // First value = initialize
    double v1 = ema.update(100.0);
    EXPECT_DOUBLE_EQ(v1, 100.0);

    // Subsequent values weighted, alpha = 0.5
    double v2 = ema.update(110.0);
    EXPECT_DOUBLE_EQ(v2, 105.0);

    // Invalid input leaves the state unchanged
    EXPECT_DOUBLE_EQ(ema.update(NaN), 105.0);
    EXPECT_EQ(ema.count, 2);
}

TEST(BaseTest, PriceArraysOrdersByDate) {
    auto bars = make_bars(5);
    std::swap(bars[0], bars[4]);

    PriceArrays prices(bars);
    ASSERT_EQ(prices.size(), 5u);
    for (size_t i = 1; i < prices.size(); i++) {
        EXPECT_LT(prices.dates[i - 1], prices.dates[i]);
    }
    EXPECT_DOUBLE_EQ(prices.volume[0], 1000.0);
}


// ========== TA-Lib Adapter Tests ==========

TEST(TalibWrapperTest, SmaStartsAtFirstValidValue) {
    std::vector<double> values = {NaN, NaN, 1.0, 2.0, 3.0, 4.0};
    auto out = talib::sma(values, 3);
    ASSERT_EQ(out.size(), values.size());
    for (int i = 0; i < 4; i++) EXPECT_TRUE(std::isnan(out[i])) << "index " << i;
    EXPECT_DOUBLE_EQ(out[4], 2.0);
    EXPECT_DOUBLE_EQ(out[5], 3.0);

    EXPECT_EQ(talib::sma({NaN, NaN}, 3).size(), 2u);
    EXPECT_THROW(talib::sma(values, 1), std::runtime_error);
}

TEST(TalibWrapperTest, ShortInputIsAllNull) {
    auto bars = make_bars(10);
    auto d = talib::adx(PriceArrays(bars), 14);
    ASSERT_EQ(d.adx.size(), 10u);
    for (double v : d.adx) EXPECT_TRUE(std::isnan(v));
    for (double v : d.plus_di) EXPECT_TRUE(std::isnan(v));
}


// ========== Trend Tests ==========

TEST(SmaTest, NullPrefixAndFirstValue) {
    auto bars = make_bars(60);
    IndicatorCalculator calc;
    auto result = calc.calculate_for_series(bars, {"SMA_20"});

    ASSERT_TRUE(result.count("SMA_20"));
    const auto& points = result.at("SMA_20").values;
    ASSERT_EQ(points.size(), 60u);

    for (int i = 0; i < 19; i++) {
        EXPECT_FALSE(points[i].values.at("SMA").has_value()) << "index " << i;
    }

    double sum = 0.0;
    for (int i = 0; i < 20; i++) sum += bars[i].close;
    ASSERT_TRUE(points[19].values.at("SMA").has_value());
    EXPECT_DOUBLE_EQ(*points[19].values.at("SMA"), sum / 20.0);
}

TEST(EmaTest, ConstantSeriesStaysConstant) {
    auto bars = make_bars(30);
    for (auto& b : bars) {
        b.open = b.close = b.adj_close = 42.0;
        b.high = 42.5;
        b.low = 41.5;
    }
    auto cols = EmaIndicator{12}.compute(PriceArrays(bars));
    const auto& ema = column(cols, "EMA");

    EXPECT_TRUE(std::isnan(ema[10]));
    for (int i = 11; i < 30; i++) EXPECT_DOUBLE_EQ(ema[i], 42.0);
}

TEST(MacdTest, WarmupAndHistogram) {
    auto bars = make_bars(80);
    auto cols = MacdIndicator{}.compute(PriceArrays(bars));
    const auto& macd = column(cols, "MACD");
    const auto& signal = column(cols, "signal");
    const auto& hist = column(cols, "histogram");

    EXPECT_TRUE(std::isnan(macd[24]));
    EXPECT_TRUE(std::isfinite(macd[25]));

    // Signal needs nine MACD values
    EXPECT_TRUE(std::isnan(signal[32]));
    EXPECT_TRUE(std::isfinite(signal[33]));

    for (int i = 33; i < 80; i++) {
        EXPECT_NEAR(hist[i], macd[i] - signal[i], 1e-12);
    }
}

TEST(AdxTest, WarmupAndBounds) {
    auto bars = make_bars(80);
    auto cols = AdxIndicator{14}.compute(PriceArrays(bars));
    const auto& adx = column(cols, "ADX");
    const auto& di_plus = column(cols, "DI+");
    const auto& di_minus = column(cols, "DI-");

    EXPECT_TRUE(std::isnan(di_plus[13]));
    EXPECT_TRUE(std::isfinite(di_plus[14]));
    EXPECT_TRUE(std::isnan(adx[26]));
    EXPECT_TRUE(std::isfinite(adx[27]));

    for (int i = 27; i < 80; i++) {
        EXPECT_GE(adx[i], 0.0);
        EXPECT_LE(adx[i], 100.0);
        EXPECT_GE(di_plus[i], 0.0);
        EXPECT_GE(di_minus[i], 0.0);
    }
}


// ========== Momentum Tests ==========

TEST(RsiTest, ValuesStayInBounds) {
    auto bars = make_bars(120);
    auto cols = RsiIndicator{14}.compute(PriceArrays(bars));
    const auto& rsi = column(cols, "RSI");

    EXPECT_TRUE(std::isnan(rsi[12]));
    EXPECT_TRUE(std::isfinite(rsi[13]));
    for (double v : rsi) {
        if (std::isnan(v)) continue;
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 100.0);
    }
}

TEST(RsiTest, NoLossesGivesHundred) {
    auto cols = RsiIndicator{14}.compute(PriceArrays(make_rising_bars(30)));
    const auto& rsi = column(cols, "RSI");
    for (int i = 13; i < 30; i++) EXPECT_DOUBLE_EQ(rsi[i], 100.0);
}

TEST(StochTest, CloseAtHighestHighGivesHundred) {
    auto bars = make_bars(20);
    for (auto& b : bars) b.close = b.high;
    bars.back().high = 500.0;
    bars.back().close = 500.0;

    auto cols = StochIndicator{14, 3}.compute(PriceArrays(bars));
    const auto& k = column(cols, "%K");
    const auto& d = column(cols, "%D");

    EXPECT_TRUE(std::isnan(k[12]));
    EXPECT_TRUE(std::isfinite(k[13]));
    EXPECT_NEAR(k[19], 100.0, 1e-9);
    EXPECT_TRUE(std::isnan(d[14]));
    EXPECT_TRUE(std::isfinite(d[15]));
}

TEST(StochTest, FlatRangeGivesZero) {
    auto bars = make_bars(20);
    for (auto& b : bars) b.open = b.high = b.low = b.close = 10.0;

    auto cols = StochIndicator{14, 3}.compute(PriceArrays(bars));
    const auto& k = column(cols, "%K");
    const auto& d = column(cols, "%D");
    for (int i = 13; i < 20; i++) EXPECT_DOUBLE_EQ(k[i], 0.0);
    for (int i = 15; i < 20; i++) EXPECT_DOUBLE_EQ(d[i], 0.0);
}


// ========== Volatility Tests ==========

TEST(BollingerTest, BandsAreOrdered) {
    auto bars = make_bars(100);
    IndicatorCalculator calc;
    auto result = calc.calculate_for_series(bars, {"BB_20"});
    ASSERT_TRUE(result.count("BB_20"));

    int checked = 0;
    for (const auto& p : result.at("BB_20").values) {
        const auto& upper = p.values.at("upper");
        const auto& middle = p.values.at("middle");
        const auto& lower = p.values.at("lower");
        if (!upper || !middle || !lower) continue;
        EXPECT_GE(*upper, *middle);
        EXPECT_GE(*middle, *lower);
        checked++;
    }
    EXPECT_EQ(checked, 81);
}

TEST(AtrTest, ConstantRange) {
    auto bars = make_bars(30);
    for (auto& b : bars) {
        b.open = b.close = b.adj_close = 20.0;
        b.high = 20.5;
        b.low = 19.5;
    }
    auto cols = AtrIndicator{14}.compute(PriceArrays(bars));
    const auto& atr = column(cols, "ATR");

    // No true range on the first bar, so the first full window ends at 14
    EXPECT_TRUE(std::isnan(atr[13]));
    for (int i = 14; i < 30; i++) EXPECT_DOUBLE_EQ(atr[i], 1.0);
}


// ========== Volume Tests ==========

TEST(ObvTest, RunningTotal) {
    auto bars = make_bars(4);
    double closes[] = {10.0, 11.0, 11.0, 10.0};
    int64_t volumes[] = {100, 200, 300, 400};
    for (int i = 0; i < 4; i++) {
        bars[i].close = closes[i];
        bars[i].volume = volumes[i];
    }

    auto cols = ObvIndicator{}.compute(PriceArrays(bars));
    const auto& obv = column(cols, "OBV");
    EXPECT_DOUBLE_EQ(obv[0], 100.0);
    EXPECT_DOUBLE_EQ(obv[1], 300.0);
    EXPECT_DOUBLE_EQ(obv[2], 300.0);   // flat close leaves it unchanged
    EXPECT_DOUBLE_EQ(obv[3], -100.0);
}

TEST(CmfTest, CloseAtHighIsPlusOne) {
    auto bars = make_bars(25);
    for (auto& b : bars) b.close = b.high;

    auto cols = CmfIndicator{20}.compute(PriceArrays(bars));
    const auto& cmf = column(cols, "CMF");
    EXPECT_TRUE(std::isnan(cmf[18]));
    for (int i = 19; i < 25; i++) EXPECT_NEAR(cmf[i], 1.0, 1e-12);
}

TEST(CmfTest, ZeroVolumeIsNull) {
    auto bars = make_bars(25);
    for (auto& b : bars) b.volume = 0;

    auto cols = CmfIndicator{20}.compute(PriceArrays(bars));
    for (double v : column(cols, "CMF")) EXPECT_TRUE(std::isnan(v));
}

TEST(VolumeSmaTest, AveragesVolume) {
    auto bars = make_bars(20);
    auto cols = VolumeSmaIndicator{20}.compute(PriceArrays(bars));
    // volumes 1000..1190 step 10
    EXPECT_DOUBLE_EQ(column(cols, "Volume_SMA")[19], 1095.0);
}


// ========== Registry Tests ==========

TEST(RegistryTest, CatalogContents) {
    const auto& catalog = indicator_catalog();
    EXPECT_EQ(catalog.size(), 14u);
    EXPECT_TRUE(is_registered("MACD"));
    EXPECT_TRUE(is_registered("VOLUME_SMA_20"));
    EXPECT_FALSE(is_registered("SMA_100"));

    auto rsi = lookup_indicator("RSI_14");
    ASSERT_TRUE(rsi.has_value());
    EXPECT_EQ(rsi->kind, IndicatorKind::RSI);
    EXPECT_EQ(rsi->params.period, 14);
    EXPECT_EQ(rsi->category, "momentum");
    EXPECT_EQ(rsi->parameter_map().at("period"), 14.0);
}

TEST(RegistryTest, GeneratedMovingAverages) {
    auto sma = lookup_indicator("SMA_100");
    ASSERT_TRUE(sma.has_value());
    EXPECT_EQ(sma->kind, IndicatorKind::SMA);
    EXPECT_EQ(sma->min_periods, 100);

    EXPECT_FALSE(lookup_indicator("SMA_").has_value());
    EXPECT_FALSE(lookup_indicator("SMA_1").has_value());
    EXPECT_FALSE(lookup_indicator("SMA_x5").has_value());
    EXPECT_FALSE(lookup_indicator("RSI_7").has_value());
}


// ========== Calculator Tests ==========

TEST(CalculatorTest, EveryIdentifierMatchesInputLength) {
    auto bars = make_bars(300);
    std::vector<std::string> ids;
    for (const auto& spec : indicator_catalog()) ids.push_back(spec.id);

    IndicatorCalculator calc;
    auto result = calc.calculate_for_series(bars, ids);
    EXPECT_EQ(result.size(), ids.size());
    for (const auto& [id, series] : result) {
        EXPECT_EQ(series.values.size(), bars.size()) << id;
        EXPECT_EQ(series.name, id);
        for (const auto& name : series.outputs) {
            EXPECT_TRUE(series.values.back().values.count(name)) << id << " " << name;
        }
    }
}

TEST(CalculatorTest, InsufficientHistoryIsOmitted) {
    auto bars = make_bars(10);
    IndicatorCalculator calc;

    auto result = calc.calculate_for_series(bars, {"SMA_50", "SMA_5"});
    EXPECT_FALSE(result.count("SMA_50"));
    EXPECT_TRUE(result.count("SMA_5"));

    auto outcomes = calc.evaluate(PriceArrays(bars), {"SMA_50"});
    const auto& o = outcomes.at("SMA_50");
    EXPECT_EQ(o.status(), IndicatorOutcome::Status::InsufficientHistory);
    EXPECT_EQ(o.have(), 10);
    EXPECT_EQ(o.need(), 50);
    EXPECT_STREQ(o.status_name(), "insufficient_history");
}

TEST(CalculatorTest, UnknownIdentifierFailsAlone) {
    auto bars = make_bars(40);
    IndicatorCalculator calc;

    auto outcomes = calc.evaluate(PriceArrays(bars), {"FOO_3", "SMA_20", "SMA_20"});
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes.at("FOO_3").status(), IndicatorOutcome::Status::Failed);
    EXPECT_EQ(outcomes.at("FOO_3").reason(), "unknown indicator");
    EXPECT_TRUE(outcomes.at("SMA_20").ok());
}

TEST(CalculatorTest, EmptySeriesYieldsNothing) {
    IndicatorCalculator calc;
    EXPECT_TRUE(calc.calculate_for_series(std::vector<DailyBar>{}, {"SMA_20"}).empty());
}

TEST(CalculatorTest, WeeklySeriesUsesWeekEnding) {
    WeeklyAggregator agg;
    auto weekly = agg.aggregate_to_weekly(make_bars(140));
    ASSERT_GE(weekly.size(), 20u);

    IndicatorCalculator calc;
    auto result = calc.calculate_for_series(weekly, {"SMA_20"});
    ASSERT_TRUE(result.count("SMA_20"));
    const auto& points = result.at("SMA_20").values;
    ASSERT_EQ(points.size(), weekly.size());
    for (size_t i = 0; i < weekly.size(); i++) {
        EXPECT_EQ(points[i].date, weekly[i].week_ending);
    }
}


// ========== Series Helper Tests ==========

TEST(IndicatorSeriesTest, LatestValueAndChartFormat) {
    auto bars = make_bars(25);
    IndicatorCalculator calc;
    auto series = calc.calculate_for_series(bars, {"SMA_20"}).at("SMA_20");

    auto latest = series.latest_value();
    ASSERT_TRUE(latest.has_value());
    EXPECT_TRUE(latest->at("SMA").has_value());

    auto early = series.value_at(bars[3].date);
    ASSERT_TRUE(early.has_value());
    EXPECT_FALSE(early->at("SMA").has_value());
    EXPECT_FALSE(series.value_at(Date::from_ymd(1999, 1, 1)).has_value());

    auto chart = series.to_chart_format();
    ASSERT_EQ(chart.at("SMA").size(), 6u);
    EXPECT_EQ(chart.at("SMA").front().first, static_cast<int64_t>(bars[19].date.to_epoch()) * 1000);
}
