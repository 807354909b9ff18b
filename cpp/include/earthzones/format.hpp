#pragma once

#include "earthzones/types.hpp"

#include <string>

namespace earthzones {

constexpr int DEFAULT_ZONE_DIGITS = 4;
constexpr int DEFAULT_RANGE_DIGITS = 6;

/**
 * Fixed-point degrees, e.g. format_degrees(80.7, 4) == "80.7000°"
 */
std::string format_degrees(double value, int digits);

/**
 * Half-open zone notation "[w°, e°)". A range crossing ±180 is shown as
 * the union of its two pieces.
 */
std::string pretty_range(double west, double east, int digits = DEFAULT_ZONE_DIGITS);

inline std::string pretty_range(const ZoneInterval& zi, int digits = DEFAULT_ZONE_DIGITS) {
    return pretty_range(zi.west, zi.east, digits);
}

/**
 * Bounding-range notation "[w°, e°]" for a place's longitude extent.
 * Identical endpoints are flagged as a possibly degenerate or incomplete
 * range instead of being shown as an ordinary interval.
 */
std::string pretty_lon_range(double west, double east, int digits = DEFAULT_RANGE_DIGITS);

inline std::string pretty_lon_range(const LonRange& range, int digits = DEFAULT_RANGE_DIGITS) {
    return pretty_lon_range(range.west, range.east, digits);
}

/**
 * Comma-separated zone numbers, "6, 7"
 */
std::string format_zone_list(const ZoneList& zones);

} // namespace earthzones
