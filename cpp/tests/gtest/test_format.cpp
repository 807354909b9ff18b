// =============================================================================
// Interval Formatting Tests
// =============================================================================

#include <gtest/gtest.h>
#include "earthzones/format.hpp"
#include "earthzones/zone_coverage.hpp"
#include <string>

using namespace earthzones;

class FormatTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(FormatTest, Degrees) {
    EXPECT_EQ(format_degrees(80.7, 4), "80.7000°");
    EXPECT_EQ(format_degrees(-0.5, 2), "-0.50°");
    EXPECT_EQ(format_degrees(180.0, 0), "180°");
}

TEST_F(FormatTest, ZoneIntervalIsHalfOpen) {
    EXPECT_EQ(pretty_range(80.7, 116.7), "[80.7000°, 116.7000°)");
    EXPECT_EQ(pretty_range(ZoneInterval{9, 80.7, 116.7}, 1), "[80.7°, 116.7°)");
}

TEST_F(FormatTest, ZoneIntervalAcrossSeam) {
    EXPECT_EQ(pretty_range(170.0, -170.0),
              "crosses ±180°: [170.0000°, 180.0000°) ∪ [-180.0000°, -170.0000°)");

    // Ends on the seam without crossing it
    EXPECT_EQ(pretty_range(144.0, -180.0), "[144.0000°, 180.0000°)");
}

TEST_F(FormatTest, BoundingRangeIsClosed) {
    EXPECT_EQ(pretty_lon_range(10.0, 20.0), "[10.000000°, 20.000000°]");
    EXPECT_EQ(pretty_lon_range(LonRange{170.0, -170.0}, 1),
              "crosses ±180°: [170.0°, 180.0°] ∪ [-180.0°, -170.0°]");
}

TEST_F(FormatTest, DegenerateBoundingRangeIsFlagged) {
    const std::string text = pretty_lon_range(42.0, 42.0, 2);
    EXPECT_EQ(text.rfind("[42.00°, 42.00°]", 0), 0u);
    EXPECT_NE(text.find("degenerate"), std::string::npos);
}

TEST_F(FormatTest, ZoneList) {
    EXPECT_EQ(format_zone_list(zones_covered_by_range(170.0, -170.0)), "6, 7");
    EXPECT_EQ(format_zone_list({}), "");
}
