#pragma once

#include <cstdint>
#include <vector>

namespace earthzones {

// Zone geometry constants
constexpr double ZONE_WIDTH_DEG = 36.0;
constexpr int ZONE_COUNT = 10;
constexpr int LAST_ZONE = ZONE_COUNT - 1;

constexpr double MIN_LONGITUDE = -180.0;
constexpr double MAX_LONGITUDE = 180.0;
constexpr double FULL_CIRCLE_DEG = 360.0;

// Langfang meridian, east boundary (exclusive) of zone 9
constexpr double DEFAULT_ZONE9_EAST_BOUNDARY = 116.7;

/**
 * One of the ten 36° zones.
 * Half-open arc [west, east) measured eastward; west > east when the
 * arc crosses the antimeridian.
 */
struct ZoneInterval {
    int zone = 0;
    double west = 0.0;
    double east = 0.0;
};

constexpr bool operator==(const ZoneInterval& lhs, const ZoneInterval& rhs) noexcept {
    return lhs.zone == rhs.zone && lhs.west == rhs.west && lhs.east == rhs.east;
}

constexpr bool operator!=(const ZoneInterval& lhs, const ZoneInterval& rhs) noexcept {
    return !(lhs == rhs);
}

/**
 * Longitude range in edge form. Wraps through ±180 when west > east.
 */
struct LonRange {
    double west = 0.0;
    double east = 0.0;
};

constexpr bool operator==(const LonRange& lhs, const LonRange& rhs) noexcept {
    return lhs.west == rhs.west && lhs.east == rhs.east;
}

constexpr bool operator!=(const LonRange& lhs, const LonRange& rhs) noexcept {
    return !(lhs == rhs);
}

// A west == east range: single meridian or an upstream data quirk
constexpr bool is_degenerate(const LonRange& range) noexcept {
    return range.west == range.east;
}

/**
 * Non-wrapping piece of a LonRange, a < b.
 */
struct RangeSegment {
    double a = 0.0;
    double b = 0.0;
};

constexpr bool operator==(const RangeSegment& lhs, const RangeSegment& rhs) noexcept {
    return lhs.a == rhs.a && lhs.b == rhs.b;
}

using SegmentList = std::vector<RangeSegment>;
using ZoneList = std::vector<ZoneInterval>;

/**
 * Zone tiling configuration. The only configuration the engine takes;
 * passed by value into every entry point.
 */
struct ZoneScheme {
    double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY;
};

} // namespace earthzones
