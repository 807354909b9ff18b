#pragma once

#include "earthzones/geocoder.hpp"
#include "earthzones/types.hpp"

#include <optional>
#include <string>

namespace earthzones::geo {

/**
 * Everything known about one query: the zone of its representative
 * longitude and, when the place has an extent, every zone that extent
 * touches.
 */
struct PlaceReport {
    std::string query;
    double center_lon = 0.0;                  // point form
    ZoneInterval center_zone;
    std::optional<LonRange> bounding_range;   // edge form
    ZoneList covered_zones;                   // ascending zone number
    bool degenerate_range = false;            // bounding range west == east
    std::string note;
    size_t sample_lon_count = 0;              // outline points behind the range
};

/**
 * Report for a bare longitude
 */
PlaceReport build_point_report(const std::string& query, double lon, const ZoneScheme& scheme);

/**
 * Report for a longitude plus an extent, with the covered zones resolved
 */
PlaceReport build_range_report(const std::string& query, double center_lon,
                               const LonRange& range, const ZoneScheme& scheme);

/**
 * Report for a geocoder match
 */
PlaceReport build_geocoded_report(const std::string& query, const GeocodeResult& match,
                                  const ZoneScheme& scheme);

/**
 * Resolve user input: a longitude text ("116.7", "116.7,39.9") first,
 * then the geocoder if one is given.
 * @return std::nullopt when the text is not a longitude and no geocoder
 *         match exists
 */
std::optional<PlaceReport> resolve_place(const std::string& query, const ZoneScheme& scheme,
                                         Geocoder* geocoder = nullptr);

} // namespace earthzones::geo
