#include "gtest/gtest.h"

#include "fluxed/shape.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace fluxed;

namespace {

NdShape from_rows(const std::vector<std::string>& rows) {
    std::vector<int> v;
    for (const auto& r : rows)
        for (char c : r) v.push_back(c - '0');
    return NdShape({rows.size(), rows[0].size()}, v);
}

NdShape donut() {
    return from_rows({
        "1111111",
        "1000001",
        "1011101",
        "1011101",
        "1011101",
        "1000001",
        "1111111",
    });
}

} // namespace

TEST(NdShape, RejectsValuesOtherThanZeroAndOne) {
    try {
        NdShape s({2, 2}, {0, 1, 2, 1});
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("Found: [0 1 2]"), std::string::npos) << e.what();
    }
}

TEST(NdShape, RejectsBadExtents) {
    EXPECT_THROW(NdShape({}, {}), std::invalid_argument);
    EXPECT_THROW(NdShape({3, 0}, {}), std::invalid_argument);
    EXPECT_THROW(NdShape({2, 2}, {0, 0, 0}), std::invalid_argument);
}

TEST(NdShape, IndexAndUnravelAreRowMajor) {
    NdShape s = NdShape::hollow_box({3, 4, 5});
    EXPECT_EQ(s.dimensions(), 3u);
    EXPECT_EQ(s.size(), 60u);
    EXPECT_EQ(s.index({1, 2, 3}), 33u);
    EXPECT_EQ(s.unravel(33), (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_THROW(s.index({3, 0, 0}), std::out_of_range);
    EXPECT_THROW(s.index({0, 0}), std::invalid_argument);
}

TEST(NdShape, FaceNeighbours) {
    NdShape s({3, 4}, std::vector<int>(12, 0));
    // cell 5 = (1,1)
    EXPECT_EQ(s.neighbor(5, 0), 9);
    EXPECT_EQ(s.neighbor(5, 1), 1);
    EXPECT_EQ(s.neighbor(5, 2), 6);
    EXPECT_EQ(s.neighbor(5, 3), 4);
    EXPECT_EQ(s.neighbor(0, 1), -1);
    EXPECT_EQ(s.neighbor(0, 3), -1);
    EXPECT_EQ(s.neighbor(11, 0), -1);
    EXPECT_EQ(s.neighbor(11, 2), -1);
}

TEST(NdShape, DonutEnclosesTheRingBetweenBorders) {
    NdShape s = donut();
    EXPECT_TRUE(s.is_closed());
    EXPECT_EQ(s.border_count(), 33u);
    EXPECT_EQ(s.enclosed_count(), 16u);
    EXPECT_EQ(s.region_count(), 1u);
    EXPECT_EQ(s.enclosed_mask()[s.index({1, 1})], 1);
    EXPECT_EQ(s.enclosed_mask()[s.index({3, 3})], 0); // solid core
}

TEST(NdShape, HollowBoxEnclosesItsInterior) {
    NdShape s = NdShape::hollow_box({5, 5, 5});
    EXPECT_TRUE(s.is_closed());
    EXPECT_EQ(s.enclosed_count(), 27u);
    EXPECT_EQ(s.border_count(), 98u);
    EXPECT_EQ(s.at({2, 2, 2}), 0);
    EXPECT_EQ(s.at({0, 2, 2}), 1);
}

TEST(NdShape, GapInBorderMeansNotClosed) {
    NdShape s = from_rows({
        "11011",
        "10001",
        "10001",
        "11111",
    });
    EXPECT_FALSE(s.is_closed());
    EXPECT_EQ(s.enclosed_count(), 0u);
    EXPECT_EQ(s.region_count(), 0u);
    EXPECT_EQ(s.exterior_mask()[s.index({2, 2})], 1);
}

TEST(NdShape, DiagonalContactDoesNotLeak) {
    NdShape s = from_rows({
        "0111",
        "1001",
        "1001",
        "1110",
    });
    EXPECT_TRUE(s.is_closed());
    EXPECT_EQ(s.enclosed_count(), 4u);
}

TEST(NdShape, SeparateChambersGetSeparateLabels) {
    NdShape s = from_rows({
        "1111111",
        "1001001",
        "1111111",
    });
    ASSERT_EQ(s.region_count(), 2u);
    const auto& labels = s.region_labels();
    EXPECT_EQ(labels[8], 1u);
    EXPECT_EQ(labels[9], 1u);
    EXPECT_EQ(labels[11], 2u);
    EXPECT_EQ(labels[12], 2u);
    EXPECT_EQ(labels[10], 0u);
}

TEST(NdShape, OneDimensionalShapes) {
    EXPECT_EQ(NdShape({4}, {1, 0, 0, 1}).enclosed_count(), 2u);
    EXPECT_EQ(NdShape({4}, {0, 1, 0, 1}).enclosed_count(), 1u);
    EXPECT_FALSE(NdShape({4}, {1, 0, 0, 0}).is_closed());
}

TEST(NdShape, NoInteriorCellMeansNeverClosed) {
    EXPECT_FALSE(NdShape({2, 2}, {0, 0, 0, 0}).is_closed());
    EXPECT_FALSE(NdShape::hollow_box({2, 6}).is_closed());
    EXPECT_FALSE(NdShape({1, 1}, {1}).is_closed());
}

TEST(NdShape, RejectsGridsTooLargeToStore) {
    const std::size_t big = std::size_t(1) << 32;
    EXPECT_THROW(NdShape::cell_count({big, big}), std::invalid_argument);
    EXPECT_THROW(NdShape::cell_count({big, big, big, big}), std::invalid_argument);
    EXPECT_THROW(NdShape({big, big}, {}), std::invalid_argument);
    EXPECT_THROW(NdShape::hollow_box({100000, 100000, 100000}), std::invalid_argument);
    EXPECT_EQ(NdShape::cell_count({5, 5, 5}), 125u);
    EXPECT_EQ(NdShape::cell_count({NdShape::MAX_CELLS}), NdShape::MAX_CELLS);
}
