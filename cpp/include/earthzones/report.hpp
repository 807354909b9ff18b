#pragma once

#include "earthzones/format.hpp"
#include "earthzones/place.hpp"

#include <boost/json.hpp>

#include <string>

namespace earthzones::geo {

struct DisplayOptions {
    int zone_digits = DEFAULT_ZONE_DIGITS;
    int range_digits = DEFAULT_RANGE_DIGITS;
};

/**
 * Multi-line text block for a report:
 *   note, input, longitude range (or point longitude), then either the
 *   covered zones with their intervals or the single owning zone.
 * Zone intervals are half-open.
 */
std::string format_place_report(const PlaceReport& report, const DisplayOptions& options = DisplayOptions{});

boost::json::object to_json(const ZoneInterval& zi, const DisplayOptions& options = DisplayOptions{});

/**
 * JSON form of a report: query, center_lon, center_zone, lon_range
 * (null when absent), degenerate, note, zones_list, zones, sample_lon_count
 */
boost::json::object to_json(const PlaceReport& report, const DisplayOptions& options = DisplayOptions{});

} // namespace earthzones::geo
