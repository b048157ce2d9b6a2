#include <gtest/gtest.h>

#include "../src/db_core/SeatLabels.h"

#include <string>
#include <vector>

TEST(SeatLabelsTest, RowLabelsNumberFromOne) {
    const auto labels = SeatLabels::rowLabels(4);
    ASSERT_EQ(labels.size(), 4u);
    EXPECT_EQ(labels.front(), "A1");
    EXPECT_EQ(labels.back(), "A4");

    EXPECT_EQ(SeatLabels::rowLabels(2, "C"), (std::vector<std::string>{"C1", "C2"}));
    EXPECT_TRUE(SeatLabels::rowLabels(0).empty());
    EXPECT_TRUE(SeatLabels::rowLabels(-3).empty());
}

TEST(SeatLabelsTest, NumbersCompareByValue) {
    EXPECT_TRUE(SeatLabels::naturalLess("A2", "A10"));
    EXPECT_FALSE(SeatLabels::naturalLess("A10", "A2"));
    EXPECT_TRUE(SeatLabels::naturalLess("A9", "B1"));
    EXPECT_TRUE(SeatLabels::naturalLess("A", "A1"));
    EXPECT_FALSE(SeatLabels::naturalLess("A7", "A7"));
}

TEST(SeatLabelsTest, LettersIgnoreCaseAndZerosIgnorePadding) {
    EXPECT_TRUE(SeatLabels::naturalLess("a3", "B1"));
    EXPECT_TRUE(SeatLabels::naturalLess("A02", "A3"));
    // equal under natural order, still a strict weak ordering
    EXPECT_NE(SeatLabels::naturalLess("A01", "A1"), SeatLabels::naturalLess("A1", "A01"));
}

TEST(SeatLabelsTest, SortNaturalOrdersAWholeRow) {
    std::vector<std::string> labels{"A10", "A1", "B2", "A2", "A30", "A3"};
    SeatLabels::sortNatural(labels, [](const std::string& s) -> const std::string& { return s; });
    EXPECT_EQ(labels, (std::vector<std::string>{"A1", "A2", "A3", "A10", "A30", "B2"}));
}
