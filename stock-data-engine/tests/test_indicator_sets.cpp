#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "indicators/indicator_sets.h"
#include "indicators/registry.h"

using namespace sde;

// ========== Resolve Tests ==========

TEST(IndicatorSetsTest, NamedSet) {
    auto ids = IndicatorSetManager::resolve("scan_volatility");
    EXPECT_EQ(ids, (std::vector<std::string>{"ATR_14", "BB_20"}));
    EXPECT_EQ(IndicatorSetManager::resolve("default"), IndicatorSetManager::default_indicators());
}

TEST(IndicatorSetsTest, AllIsSortedUnionOfSets) {
    auto ids = IndicatorSetManager::resolve("all");
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
    EXPECT_TRUE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());

    for (const auto& [name, members] : IndicatorSetManager::sets()) {
        for (const auto& id : members) {
            EXPECT_TRUE(std::binary_search(ids.begin(), ids.end(), id)) << name << " " << id;
        }
    }
    // Every set member is a catalog entry, so "all" covers the whole catalog
    EXPECT_EQ(ids.size(), indicator_catalog().size());
}

TEST(IndicatorSetsTest, CommaListIsTrimmed) {
    auto ids = IndicatorSetManager::resolve(" RSI_14 , MACD,SMA_20 ");
    EXPECT_EQ(ids, (std::vector<std::string>{"RSI_14", "MACD", "SMA_20"}));
}

TEST(IndicatorSetsTest, SingleIdentifierPassesThrough) {
    EXPECT_EQ(IndicatorSetManager::resolve("OBV"), (std::vector<std::string>{"OBV"}));
    EXPECT_EQ(IndicatorSetManager::resolve("NOT_A_THING"), (std::vector<std::string>{"NOT_A_THING"}));
}


// ========== Validate / Required Periods Tests ==========

TEST(IndicatorSetsTest, ValidateKeepsCatalogEntriesInOrder) {
    auto ids = IndicatorSetManager::validate({"MACD", "BOGUS", "SMA_100", "RSI_14"});
    EXPECT_EQ(ids, (std::vector<std::string>{"MACD", "RSI_14"}));
}

TEST(IndicatorSetsTest, RequiredPeriods) {
    EXPECT_EQ(IndicatorSetManager::required_periods({}), 0);
    EXPECT_EQ(IndicatorSetManager::required_periods({"RSI_14", "MACD"}), 35);
    EXPECT_EQ(IndicatorSetManager::required_periods(IndicatorSetManager::resolve("chart_full")), 200);
    // Outside the catalog counts as zero
    EXPECT_EQ(IndicatorSetManager::required_periods({"SMA_500"}), 0);
}

TEST(IndicatorSetsTest, SetNamesAreListed) {
    auto names = IndicatorSetManager::set_names();
    EXPECT_EQ(names.size(), 8u);
    EXPECT_TRUE(std::find(names.begin(), names.end(), "chart_basic") != names.end());
    EXPECT_TRUE(std::find(names.begin(), names.end(), "scan_momentum") != names.end());
}
