#pragma once

#include "earthzones/types.hpp"

#include <array>

namespace earthzones {

/**
 * Ten-zone longitude partition
 *
 * The circle is cut into ten 36° arcs. Zone 9 ends (exclusive) at the
 * configured east boundary; zone numbers decrease eastward (9, 8, ... 0)
 * and wrap so that zone 0 sits directly west of zone 9.
 *
 * All edges are point-form longitudes computed once from the zone 9 west
 * edge. The east edge of each zone is the west edge of the next one, so
 * the arcs share edges bit-for-bit and tile the circle without gaps or
 * overlaps even under floating-point rounding.
 */
class ZonePartitioner {
public:
    explicit ZonePartitioner(const ZoneScheme& scheme = ZoneScheme{});

    /**
     * West edge of zone 9, in point form
     */
    double origin() const noexcept { return edges_[0]; }

    /**
     * All ten zones, ordered eastward starting at zone 9
     */
    ZoneList intervals() const;

    /**
     * Zone containing a longitude. A point on an edge belongs to the zone
     * for which that edge is the west (inclusive) edge.
     * @throws InvalidNumericInputError for NaN or infinite input
     */
    ZoneInterval zone_of(double lon) const;

    /**
     * Interval of one zone by number
     * @throws InvalidArgumentError if zone is outside 0..9
     */
    ZoneInterval zone(int zone_number) const;

private:
    ZoneInterval interval_at(int steps_east) const noexcept;
    bool contains(int steps_east, double point) const noexcept;

    // edges_[k] is the west edge of the zone k steps east of the origin;
    // edges_[ZONE_COUNT] closes the ring back onto the origin
    std::array<double, ZONE_COUNT + 1> edges_;
};

// Zone number for a step count east of the origin
constexpr int zone_for_steps(int steps_east) noexcept {
    return ((LAST_ZONE - steps_east) % ZONE_COUNT + ZONE_COUNT) % ZONE_COUNT;
}

/**
 * Half-open arc containment for point-form values, west != east.
 * Exact comparisons only, no arithmetic.
 */
constexpr bool arc_contains_point(double west, double east, double point) noexcept {
    if (west < east)
        return west <= point && point < east;
    return point >= west || point < east;
}

// Free-function entry points; boundary is the zone 9 east boundary

ZoneList build_zone_intervals(double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY);

ZoneInterval point_to_zone(double lon, double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY);

ZoneInterval zone_interval(int zone_number, double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY);

double zone_origin(double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY);

} // namespace earthzones
