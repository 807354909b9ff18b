#pragma once

#include "earthzones/types.hpp"

namespace earthzones {

/**
 * Zones touched by a longitude range.
 *
 * Each zone arc is split at the antimeridian and tested against the split
 * query; a zone is reported when any pair of segments overlaps. Touching
 * at an edge does not count.
 *
 * @param range Query range in edge form, wraps when west > east
 * @param scheme Zone tiling
 * @return Covered zones, ascending by zone number
 */
ZoneList zones_covered_by_range(const LonRange& range, const ZoneScheme& scheme = ZoneScheme{});

inline ZoneList zones_covered_by_range(double west, double east,
                                       double zone9_east_boundary = DEFAULT_ZONE9_EAST_BOUNDARY) {
    return zones_covered_by_range(LonRange{west, east}, ZoneScheme{zone9_east_boundary});
}

} // namespace earthzones
