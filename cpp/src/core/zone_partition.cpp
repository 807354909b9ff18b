#include "earthzones/zone_partition.hpp"
#include "earthzones/error.hpp"
#include "earthzones/longitude.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace earthzones {

ZonePartitioner::ZonePartitioner(const ZoneScheme& scheme)
{
    const double east_boundary = normalize_point(scheme.zone9_east_boundary);
    const double origin = normalize_point(east_boundary - ZONE_WIDTH_DEG);

    edges_[0] = origin;
    for (int steps = 1; steps < ZONE_COUNT; ++steps) {
        edges_[steps] = normalize_point(origin + steps * ZONE_WIDTH_DEG);
    }
    edges_[ZONE_COUNT] = origin;
}

ZoneInterval ZonePartitioner::interval_at(int steps_east) const noexcept
{
    return ZoneInterval{zone_for_steps(steps_east), edges_[steps_east], edges_[steps_east + 1]};
}

bool ZonePartitioner::contains(int steps_east, double point) const noexcept
{
    return arc_contains_point(edges_[steps_east], edges_[steps_east + 1], point);
}

ZoneList ZonePartitioner::intervals() const
{
    ZoneList result;
    result.reserve(ZONE_COUNT);
    for (int steps = 0; steps < ZONE_COUNT; ++steps) {
        result.push_back(interval_at(steps));
    }
    return result;
}

ZoneInterval ZonePartitioner::zone_of(double lon) const
{
    const double point = normalize_point(lon);

    const double diff = floor_mod(point - origin(), FULL_CIRCLE_DEG);
    int steps = static_cast<int>(std::floor(diff / ZONE_WIDTH_DEG));
    steps = std::clamp(steps, 0, LAST_ZONE);

    // The modular estimate can land one zone off within an ulp of an edge;
    // the edge comparison is authoritative
    if (!contains(steps, point)) {
        const int west_neighbour = (steps + LAST_ZONE) % ZONE_COUNT;
        const int east_neighbour = (steps + 1) % ZONE_COUNT;
        if (contains(west_neighbour, point)) {
            steps = west_neighbour;
        } else if (contains(east_neighbour, point)) {
            steps = east_neighbour;
        } else {
            EARTHZONES_THROW(ErrorCode::INTERNAL_ERROR,
                             "Longitude " + std::to_string(point) + " is not covered by the zone tiling");
        }
    }
    return interval_at(steps);
}

ZoneInterval ZonePartitioner::zone(int zone_number) const
{
    EARTHZONES_CHECK_ARGUMENT(zone_number >= 0 && zone_number < ZONE_COUNT,
                              "Zone number must be in 0.." + std::to_string(LAST_ZONE) +
                              ", got " + std::to_string(zone_number));
    const int steps = (LAST_ZONE - zone_number) % ZONE_COUNT;
    return interval_at(steps);
}

// =============================================================================
// Free functions
// =============================================================================

ZoneList build_zone_intervals(double zone9_east_boundary)
{
    return ZonePartitioner(ZoneScheme{zone9_east_boundary}).intervals();
}

ZoneInterval point_to_zone(double lon, double zone9_east_boundary)
{
    return ZonePartitioner(ZoneScheme{zone9_east_boundary}).zone_of(lon);
}

ZoneInterval zone_interval(int zone_number, double zone9_east_boundary)
{
    return ZonePartitioner(ZoneScheme{zone9_east_boundary}).zone(zone_number);
}

double zone_origin(double zone9_east_boundary)
{
    return ZonePartitioner(ZoneScheme{zone9_east_boundary}).origin();
}

} // namespace earthzones
