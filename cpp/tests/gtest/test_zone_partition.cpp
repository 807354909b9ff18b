// =============================================================================
// Zone Partition Tests
// =============================================================================

#include <gtest/gtest.h>
#include "earthzones/error.hpp"
#include "earthzones/longitude.hpp"
#include "earthzones/zone_partition.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <vector>

using namespace earthzones;

class ZonePartitionTest : public ::testing::Test {
protected:
    void SetUp() override {
        zones = build_zone_intervals();
    }
    void TearDown() override {}

    // Every zone whose arc contains lon; exactly one is expected
    std::vector<int> owners(const ZoneList& tiling, double lon) const {
        std::vector<int> result;
        const double p = normalize_point(lon);
        for (const auto& zi : tiling) {
            if (arc_contains_point(zi.west, zi.east, p)) {
                result.push_back(zi.zone);
            }
        }
        return result;
    }

    static double width(const ZoneInterval& zi) {
        return floor_mod(zi.east - zi.west, 360.0);
    }

    ZoneList zones;
};

TEST_F(ZonePartitionTest, TenZonesDescendingEastward) {
    ASSERT_EQ(zones.size(), 10u);
    for (size_t i = 0; i < zones.size(); ++i) {
        EXPECT_EQ(zones[i].zone, static_cast<int>(9 - i));
    }

    // Zone 9 = [80.7, 116.7)
    EXPECT_NEAR(zones[0].west, 80.7, 1e-9);
    EXPECT_NEAR(zones[0].east, 116.7, 1e-9);
    EXPECT_NEAR(zone_origin(), 80.7, 1e-9);
}

TEST_F(ZonePartitionTest, ArcsShareEdgesExactly) {
    for (size_t i = 0; i < zones.size(); ++i) {
        const auto& next = zones[(i + 1) % zones.size()];
        EXPECT_EQ(zones[i].east, next.west) << "zone " << zones[i].zone;
        EXPECT_NEAR(width(zones[i]), 36.0, 1e-9) << "zone " << zones[i].zone;
    }
}

TEST_F(ZonePartitionTest, DefaultScenarios) {
    ZoneInterval z = point_to_zone(100.0);
    EXPECT_EQ(z.zone, 9);
    EXPECT_NEAR(z.west, 80.7, 1e-9);
    EXPECT_NEAR(z.east, 116.7, 1e-9);

    // East boundary of zone 9 is exclusive
    z = point_to_zone(116.7);
    EXPECT_EQ(z.zone, 8);
    EXPECT_NEAR(z.west, 116.7, 1e-9);
    EXPECT_NEAR(z.east, 152.7, 1e-9);

    // New York
    z = point_to_zone(-74.006);
    EXPECT_EQ(z.zone, 4);
    EXPECT_NEAR(z.west, -99.3, 1e-9);
    EXPECT_NEAR(z.east, -63.3, 1e-9);

    // Zone 7 straddles the antimeridian
    z = point_to_zone(180.0);
    EXPECT_EQ(z.zone, 7);
    EXPECT_NEAR(z.west, 152.7, 1e-9);
    EXPECT_NEAR(z.east, -171.3, 1e-9);
    EXPECT_EQ(point_to_zone(-180.0), z);
    EXPECT_EQ(point_to_zone(-175.0), z);
}

TEST_F(ZonePartitionTest, WestEdgeIsInclusive) {
    for (const auto& zi : zones) {
        EXPECT_EQ(point_to_zone(zi.west).zone, zi.zone);
        EXPECT_EQ(point_to_zone(zi.west - 1e-9).zone, zi.zone == 9 ? 0 : zi.zone + 1);
    }
}

// Every point is owned by exactly one arc, and point_to_zone agrees with it
TEST_F(ZonePartitionTest, TilingAgreesWithPointLookup) {
    for (int i = -1440; i <= 1440; ++i) {
        const double lon = i * 0.25;
        auto found = owners(zones, lon);
        ASSERT_EQ(found.size(), 1u) << "lon=" << lon;
        EXPECT_EQ(point_to_zone(lon).zone, found[0]) << "lon=" << lon;
    }

    // Points within an ulp of every edge
    for (const auto& zi : zones) {
        for (double lon : {zi.west, std::nextafter(zi.west, 1000.0), std::nextafter(zi.west, -1000.0)}) {
            auto found = owners(zones, lon);
            ASSERT_EQ(found.size(), 1u) << "lon=" << lon;
            EXPECT_EQ(point_to_zone(lon).zone, found[0]) << "lon=" << lon;
        }
    }
}

TEST_F(ZonePartitionTest, AlternateBoundaryAtPrimeMeridian) {
    ZonePartitioner partitioner(ZoneScheme{0.0});
    ZoneList tiling = partitioner.intervals();

    EXPECT_EQ(tiling[0].zone, 9);
    EXPECT_EQ(tiling[0].west, -36.0);
    EXPECT_EQ(tiling[0].east, 0.0);

    // Zone 4 ends exactly on the seam
    ZoneInterval z4 = partitioner.zone(4);
    EXPECT_EQ(z4.west, 144.0);
    EXPECT_EQ(z4.east, -180.0);
    EXPECT_EQ(partitioner.zone_of(179.9).zone, 4);

    ZoneInterval z3 = partitioner.zone(3);
    EXPECT_EQ(z3.west, -180.0);
    EXPECT_EQ(z3.east, -144.0);
    EXPECT_EQ(partitioner.zone_of(180.0).zone, 3);
    EXPECT_EQ(partitioner.zone_of(-180.0).zone, 3);

    for (int i = -720; i <= 720; ++i) {
        const double lon = i * 0.5;
        auto found = owners(tiling, lon);
        ASSERT_EQ(found.size(), 1u) << "lon=" << lon;
        EXPECT_EQ(partitioner.zone_of(lon).zone, found[0]) << "lon=" << lon;
    }
}

TEST_F(ZonePartitionTest, BoundaryIsNormalized) {
    ZoneList shifted = build_zone_intervals(116.7 + 360.0);
    ASSERT_EQ(shifted.size(), zones.size());
    for (size_t i = 0; i < zones.size(); ++i) {
        EXPECT_EQ(shifted[i].zone, zones[i].zone);
        EXPECT_NEAR(shifted[i].west, zones[i].west, 1e-9);
    }

    EXPECT_THROW(build_zone_intervals(std::numeric_limits<double>::quiet_NaN()), InvalidNumericInputError);
}

TEST_F(ZonePartitionTest, ZoneLookupByNumber) {
    std::set<int> seen;
    for (int n = 0; n < 10; ++n) {
        ZoneInterval zi = zone_interval(n);
        EXPECT_EQ(zi.zone, n);
        seen.insert(zi.zone);

        // Matches the tiling entry of the same number
        for (const auto& t : zones) {
            if (t.zone == n) EXPECT_EQ(t, zi);
        }
    }
    EXPECT_EQ(seen.size(), 10u);

    EXPECT_THROW(zone_interval(10), InvalidArgumentError);
    EXPECT_THROW(zone_interval(-1), InvalidArgumentError);
}

TEST_F(ZonePartitionTest, StepsToZoneNumber) {
    EXPECT_EQ(zone_for_steps(0), 9);
    EXPECT_EQ(zone_for_steps(1), 8);
    EXPECT_EQ(zone_for_steps(9), 0);
}

TEST_F(ZonePartitionTest, RejectsNonFinitePoint) {
    EXPECT_THROW(point_to_zone(std::numeric_limits<double>::infinity()), InvalidNumericInputError);
}
