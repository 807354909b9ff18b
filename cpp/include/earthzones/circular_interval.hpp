#pragma once

#include "earthzones/types.hpp"

#include <optional>
#include <vector>

namespace earthzones {

/**
 * Shortest arc on the circle containing every given longitude.
 *
 * Points are mapped to [0, 360) and sorted; the arc is the complement of
 * the widest gap between neighbours (the last-to-first gap wraps). When
 * several gaps share the maximum width, the first one in sorted order is
 * removed.
 *
 * @param lons Raw longitudes in degrees, any range, duplicates allowed
 * @return (west, east) in edge form, possibly wrapping; (p, p) for a single
 *         distinct point; std::nullopt when lons is empty
 * @throws InvalidNumericInputError if any value is NaN or infinite
 */
std::optional<LonRange> min_covering_interval(const std::vector<double>& lons);

/**
 * Split a possibly-wrapping range into non-wrapping segments.
 * Ends are normalized to edge form first. A wrapping range yields
 * [west, 180) and [-180, east); a piece of zero width is omitted.
 * A degenerate range (west == east) comes back as its single segment.
 */
SegmentList split_range(const LonRange& range);

inline SegmentList split_range(double west, double east) {
    return split_range(LonRange{west, east});
}

/**
 * Open overlap test on the real line; touching endpoints do not intersect
 */
constexpr bool segments_intersect(const RangeSegment& a, const RangeSegment& b) noexcept {
    return a.a < b.b && b.a < a.b;
}

/**
 * True if any segment of r1 intersects any segment of r2
 */
bool range_intersects_range(const LonRange& r1, const LonRange& r2);

/**
 * Eastward width of a range in degrees: 0 for a degenerate range,
 * 360 for [-180, 180].
 */
double arc_width(const LonRange& range);

/**
 * Half-open containment of a longitude in a range, [west, east).
 * A degenerate range contains only its own meridian.
 */
bool range_contains(const LonRange& range, double lon);

} // namespace earthzones
