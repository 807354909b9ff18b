#include "earthzones/place.hpp"
#include "earthzones/longitude.hpp"
#include "earthzones/text_input.hpp"
#include "earthzones/zone_coverage.hpp"
#include "earthzones/zone_partition.hpp"

namespace earthzones::geo {

PlaceReport build_point_report(const std::string& query, double lon, const ZoneScheme& scheme)
{
    PlaceReport report;
    report.query = query;
    report.center_lon = normalize_point(lon);
    report.center_zone = ZonePartitioner(scheme).zone_of(lon);
    return report;
}

PlaceReport build_range_report(const std::string& query, double center_lon,
                               const LonRange& range, const ZoneScheme& scheme)
{
    PlaceReport report = build_point_report(query, center_lon, scheme);
    report.bounding_range = LonRange{normalize_edge(range.west), normalize_edge(range.east)};
    report.degenerate_range = is_degenerate(*report.bounding_range);
    report.covered_zones = zones_covered_by_range(*report.bounding_range, scheme);
    return report;
}

PlaceReport build_geocoded_report(const std::string& query, const GeocodeResult& match,
                                  const ZoneScheme& scheme)
{
    PlaceReport report = match.bounding_range
        ? build_range_report(query, match.center_lon, *match.bounding_range, scheme)
        : build_point_report(query, match.center_lon, scheme);

    if (!match.display_name.empty())
        report.note = "matched: " + match.display_name;
    report.sample_lon_count = match.geometry_lons.size();
    return report;
}

std::optional<PlaceReport> resolve_place(const std::string& query, const ZoneScheme& scheme,
                                         Geocoder* geocoder)
{
    if (auto lon = parse_longitude_text(query))
        return build_point_report(query, *lon, scheme);

    if (!geocoder)
        return std::nullopt;

    auto match = geocoder->geocode(trim(query));
    if (!match)
        return std::nullopt;
    return build_geocoded_report(query, *match, scheme);
}

} // namespace earthzones::geo
