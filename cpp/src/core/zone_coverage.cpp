#include "earthzones/zone_coverage.hpp"
#include "earthzones/circular_interval.hpp"
#include "earthzones/zone_partition.hpp"

#include <algorithm>

namespace earthzones {

ZoneList zones_covered_by_range(const LonRange& range, const ZoneScheme& scheme)
{
    const SegmentList query = split_range(range);
    const ZonePartitioner partitioner(scheme);

    ZoneList covered;
    for (const auto& zi : partitioner.intervals()) {
        const SegmentList zone_parts = split_range(zi.west, zi.east);
        const bool hit = std::any_of(query.begin(), query.end(), [&](const RangeSegment& q) {
            return std::any_of(zone_parts.begin(), zone_parts.end(), [&](const RangeSegment& z) {
                return segments_intersect(q, z);
            });
        });
        if (hit)
            covered.push_back(zi);
    }

    std::sort(covered.begin(), covered.end(),
              [](const ZoneInterval& a, const ZoneInterval& b) { return a.zone < b.zone; });
    return covered;
}

} // namespace earthzones
