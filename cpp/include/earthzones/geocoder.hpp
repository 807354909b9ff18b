#pragma once

#include "earthzones/types.hpp"

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace earthzones::geo {

/**
 * A place as resolved by a geocoding provider
 */
struct GeocodeResult {
    std::string display_name;
    double center_lon = 0.0;
    std::optional<LonRange> bounding_range;   // edge form
    std::vector<double> geometry_lons;        // detailed outline, may be empty
};

/**
 * Place-name lookup. Implementations own all provider concerns (transport,
 * retries, rate limits); callers only see a result or "no coordinate".
 */
class Geocoder {
public:
    virtual ~Geocoder() = default;

    /**
     * @return The best match, or std::nullopt when nothing matches
     * @throws GeocodeError when the provider itself fails
     */
    virtual std::optional<GeocodeResult> geocode(const std::string& query) = 0;
};

/**
 * Replace a whole-globe bounding range ([-180, 180] exactly) by the
 * minimal covering interval of the detailed geometry. Some providers
 * report places that straddle the antimeridian this way. Any other range,
 * or an empty geometry, is returned unchanged.
 */
LonRange correct_whole_globe_range(const LonRange& range, const std::vector<double>& geometry_lons);

/**
 * Read one Nominatim "jsonv2" search record.
 * Uses lon, display_name, boundingbox ([south, north, west, east], strings
 * or numbers) and geojson / geometry. The whole-globe correction is applied
 * to the bounding range.
 * @throws GeocodeError if the record is not an object or has no usable lon
 */
GeocodeResult parse_nominatim_record(const boost::json::value& record);

/**
 * Offline geocoder over saved Nominatim records.
 *
 * A query matches a record when its display_name or name contains the
 * query, ignoring case; the first matching record in file order wins.
 */
class RecordGeocoder : public Geocoder {
public:
    /**
     * @param records A single record object or an array of them
     * @throws GeocodeError if any record is unusable
     */
    explicit RecordGeocoder(const boost::json::value& records);

    /**
     * @throws EarthZonesException / GeometryError / GeocodeError on unreadable files
     */
    static RecordGeocoder from_file(const std::string& path);

    std::optional<GeocodeResult> geocode(const std::string& query) override;

    size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::vector<std::string> keys;   // lower-cased searchable names
        GeocodeResult result;
    };

    void add_record(const boost::json::value& record);

    std::vector<Entry> entries_;
};

} // namespace earthzones::geo
