#include "earthzones/circular_interval.hpp"
#include "earthzones/longitude.hpp"

#include <algorithm>

namespace earthzones {

std::optional<LonRange> min_covering_interval(const std::vector<double>& lons)
{
    if (lons.empty())
        return std::nullopt;

    std::vector<double> pts;
    pts.reserve(lons.size());
    for (double lon : lons) {
        pts.push_back(lon_to_360(lon));
    }
    std::sort(pts.begin(), pts.end());

    if (pts.size() == 1) {
        const double w = lon360_to_edge(pts[0]);
        return LonRange{w, w};
    }

    // Widest gap, first one wins on ties
    const size_t n = pts.size();
    double max_gap = -1.0;
    size_t max_i = 0;
    for (size_t i = 0; i < n; ++i) {
        const double gap = floor_mod(pts[(i + 1) % n] - pts[i], FULL_CIRCLE_DEG);
        if (gap > max_gap) {
            max_gap = gap;
            max_i = i;
        }
    }

    // The cover runs eastward from the point after the gap to the point before it
    const double west_360 = pts[(max_i + 1) % n];
    const double east_360 = pts[max_i];
    return LonRange{lon360_to_edge(west_360), lon360_to_edge(east_360)};
}

SegmentList split_range(const LonRange& range)
{
    const double w = normalize_edge(range.west);
    const double e = normalize_edge(range.east);

    if (w <= e)
        return {RangeSegment{w, e}};

    SegmentList parts;
    if (w < MAX_LONGITUDE)
        parts.push_back(RangeSegment{w, MAX_LONGITUDE});
    if (e > MIN_LONGITUDE)
        parts.push_back(RangeSegment{MIN_LONGITUDE, e});

    // [180, -180] has no width on either side of the seam
    if (parts.empty())
        parts.push_back(RangeSegment{w, w});
    return parts;
}

bool range_intersects_range(const LonRange& r1, const LonRange& r2)
{
    const SegmentList a = split_range(r1);
    const SegmentList b = split_range(r2);
    for (const auto& sa : a) {
        for (const auto& sb : b) {
            if (segments_intersect(sa, sb))
                return true;
        }
    }
    return false;
}

double arc_width(const LonRange& range)
{
    double width = 0.0;
    for (const auto& seg : split_range(range)) {
        width += seg.b - seg.a;
    }
    return width;
}

bool range_contains(const LonRange& range, double lon)
{
    const double point = normalize_point(lon);
    if (is_degenerate(range))
        return normalize_point(range.west) == point;

    for (const auto& seg : split_range(range)) {
        if (seg.a <= point && point < seg.b)
            return true;
    }
    return false;
}

} // namespace earthzones
