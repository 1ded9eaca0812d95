/**
 * @file search_strategy_test.cpp
 * @brief 搜索策略与VehicleSearcher的单元测试
 */
#include "search_strategy.h"
#include "parking_error.h"
#include <gtest/gtest.h>
#include <vector>

namespace {

std::vector<ParkingSlot> slotsWithColors(const std::vector<std::string>& colors) {
    std::vector<ParkingSlot> slots;
    int id = 1;
    for (const auto& color : colors) {
        slots.emplace_back(id, false);
        if (!color.empty()) {
            slots.back().occupy(Vehicle("REG" + std::to_string(id), "Mazda", "CX-5", color,
                                        VehicleKind::Car));
        }
        ++id;
    }
    return slots;
}

}  // namespace

TEST(SearchStrategyTest, FreeTextMatchIgnoresCase) {
    Vehicle vehicle("ABC123", "Toyota", "Corolla", "Red", VehicleKind::Car);

    EXPECT_TRUE(ColorStrategy().match(vehicle, "rED"));
    EXPECT_TRUE(MakeStrategy().match(vehicle, "TOYOTA"));
    EXPECT_TRUE(ModelStrategy().match(vehicle, "corolla"));
    EXPECT_FALSE(ColorStrategy().match(vehicle, "Reddish"));
    EXPECT_FALSE(MakeStrategy().match(vehicle, "Toyot"));
}

TEST(SearchStrategyTest, RegistrationIsCaseSensitive) {
    Vehicle vehicle("ABC123", "Toyota", "Corolla", "Red", VehicleKind::Car);

    EXPECT_TRUE(RegistrationStrategy().match(vehicle, "ABC123"));
    EXPECT_FALSE(RegistrationStrategy().match(vehicle, "abc123"));
}

TEST(SearchStrategyTest, FactoryBuildsMatchingStrategy) {
    for (auto criterion : {SearchCriterion::Color, SearchCriterion::Make,
                           SearchCriterion::Model, SearchCriterion::Registration}) {
        EXPECT_EQ(makeSearchStrategy(criterion)->criterion(), criterion);
    }
}

TEST(SearchStrategyTest, ParsesCriterionNames) {
    EXPECT_EQ(parseSearchCriterion("Color"), SearchCriterion::Color);
    EXPECT_EQ(parseSearchCriterion("MAKE"), SearchCriterion::Make);
    EXPECT_EQ(parseSearchCriterion("model"), SearchCriterion::Model);
    EXPECT_EQ(parseSearchCriterion("registration"), SearchCriterion::Registration);

    try {
        parseSearchCriterion("owner");
        FAIL() << "expected UnknownCriterion";
    } catch (const ParkingException& e) {
        EXPECT_EQ(e.code(), ParkingErrorCode::UnknownCriterion);
    }
}

TEST(VehicleSearcherTest, ReturnsOneBasedIdsOfMatches) {
    auto slots = slotsWithColors({"Red", "Blue", "Red"});
    VehicleSearcher searcher(std::make_unique<ColorStrategy>());

    EXPECT_EQ(searcher.search(slots, "red"), (std::vector<int>{1, 3}));
    EXPECT_EQ(searcher.search(slots, "BLUE"), (std::vector<int>{2}));
    EXPECT_TRUE(searcher.search(slots, "green").empty());
}

TEST(VehicleSearcherTest, SkipsEmptySlots) {
    auto slots = slotsWithColors({"", "Red", "", "Red"});
    VehicleSearcher searcher(std::make_unique<ColorStrategy>());

    EXPECT_EQ(searcher.search(slots, "Red"), (std::vector<int>{2, 4}));
}

TEST(VehicleSearcherTest, StrategyCanBeSwapped) {
    auto slots = slotsWithColors({"Red", "Blue", "Red"});
    VehicleSearcher searcher(std::make_unique<ColorStrategy>());

    searcher.setStrategy(std::make_unique<RegistrationStrategy>());
    EXPECT_EQ(searcher.getStrategy().criterion(), SearchCriterion::Registration);
    EXPECT_EQ(searcher.search(slots, "REG2"), (std::vector<int>{2}));
    EXPECT_TRUE(searcher.search(slots, "reg2").empty());

    EXPECT_THROW(searcher.setStrategy(nullptr), std::invalid_argument);
}
