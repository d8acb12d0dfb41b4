#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chance/weighted_picker.h"
#include "core/rng.h"

namespace {

using sprocket::chance::WeightedPicker;
using sprocket::core::Pcg32;

std::vector<std::size_t> countPicks(const WeightedPicker<std::string>& picker, Pcg32& rng, int draws) {
    std::vector<std::size_t> counts(picker.size(), 0);
    for (int i = 0; i < draws; ++i) {
        ++counts[picker.pickIndex(rng)];
    }
    return counts;
}

TEST(WeightedPicker, RejectsInvalidTables) {
    EXPECT_FALSE(WeightedPicker<int>::create({}).has_value());
    EXPECT_FALSE(WeightedPicker<int>::create({{1, 1.0}, {2, -0.5}}).has_value());
    EXPECT_FALSE(WeightedPicker<int>::create({{1, 0.0}, {2, 0.0}}).has_value());
    EXPECT_FALSE(WeightedPicker<int>::create({{1, std::numeric_limits<double>::quiet_NaN()}}).has_value());
    EXPECT_FALSE(WeightedPicker<int>::create({{1, std::numeric_limits<double>::infinity()}}).has_value());
}

TEST(WeightedPicker, SingleEntryAlwaysPicked) {
    auto picker = WeightedPicker<std::string>::create({{"only", 0.25}});
    ASSERT_TRUE(picker.has_value());
    Pcg32 rng(7);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(picker->pick(rng), "only");
    }
    EXPECT_DOUBLE_EQ(picker->probabilityOf(0), 1.0);
}

TEST(WeightedPicker, ZeroWeightEntriesAreNeverPicked) {
    auto picker = WeightedPicker<std::string>::create({{"never", 0.0}, {"a", 1.0}, {"also never", 0.0}, {"b", 3.0}});
    ASSERT_TRUE(picker.has_value());
    Pcg32 rng(11);
    const std::vector<std::size_t> counts = countPicks(*picker, rng, 20000);
    EXPECT_EQ(counts[0], 0u);
    EXPECT_EQ(counts[2], 0u);
    EXPECT_GT(counts[1], 0u);
    EXPECT_GT(counts[3], counts[1]);
}

TEST(WeightedPicker, FrequenciesConvergeToNormalizedWeights) {
    auto picker = WeightedPicker<std::string>::create({
        {"common", 60.0},
        {"uncommon", 25.0},
        {"rare", 10.0},
        {"epic", 4.0},
        {"legendary", 1.0}
    });
    ASSERT_TRUE(picker.has_value());
    EXPECT_DOUBLE_EQ(picker->probabilityOf(0), 0.6);
    EXPECT_DOUBLE_EQ(picker->probabilityOf(4), 0.01);
    EXPECT_DOUBLE_EQ(picker->probabilityOf(99), 0.0);

    Pcg32 rng(0xC0FFEEULL);
    constexpr int kDraws = 200000;
    const std::vector<std::size_t> counts = countPicks(*picker, rng, kDraws);
    for (std::size_t i = 0; i < counts.size(); ++i) {
        const double observed = static_cast<double>(counts[i]) / kDraws;
        EXPECT_NEAR(observed, picker->probabilityOf(i), 0.01) << *picker->itemAt(i);
    }
}

TEST(WeightedPicker, SameSeedSameSequence) {
    auto picker = WeightedPicker<int>::create({{1, 1.0}, {2, 2.0}, {3, 3.0}});
    ASSERT_TRUE(picker.has_value());
    Pcg32 first(99);
    Pcg32 second(99);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(picker->pick(first), picker->pick(second));
    }
}

TEST(WeightedPicker, ItemAtIsBoundsChecked) {
    auto picker = WeightedPicker<std::string>::create({{"sword", 2.0}, {"shield", 1.0}});
    ASSERT_TRUE(picker.has_value());
    ASSERT_NE(picker->itemAt(1), nullptr);
    EXPECT_EQ(*picker->itemAt(1), "shield");
    EXPECT_EQ(picker->itemAt(2), nullptr);

    *picker->itemAt(0) = "rusty sword";
    const WeightedPicker<std::string>& view = *picker;
    EXPECT_EQ(*view.itemAt(0), "rusty sword");
    EXPECT_EQ(view.size(), 2u);
}

TEST(WeightedPicker, PickOnceMovesChosenItemOut) {
    Pcg32 rng(3);
    const std::optional<std::string> item = WeightedPicker<std::string>::pickOnce({{"x", 0.0}, {"y", 5.0}}, rng);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "y");

    EXPECT_FALSE(WeightedPicker<std::string>::pickOnce({}, rng).has_value());
}

} // namespace
