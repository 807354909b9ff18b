#include "earthzones/geocoder.hpp"
#include "earthzones/circular_interval.hpp"
#include "earthzones/error.hpp"
#include "earthzones/geometry.hpp"
#include "earthzones/logging.hpp"
#include "earthzones/longitude.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string_view>

namespace json = boost::json;

namespace earthzones::geo {

namespace {

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Nominatim sends coordinates as strings; accept numbers too
std::optional<double> read_degrees(const json::value& v)
{
    if (v.is_number()) {
        double d = v.to_number<double>();
        if (std::isfinite(d)) return d;
        return std::nullopt;
    }
    if (!v.is_string())
        return std::nullopt;

    std::string_view text(v.get_string().data(), v.get_string().size());
    if (!text.empty() && text.front() == '+')
        text.remove_prefix(1);

    double d = 0.0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), d);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size() || !std::isfinite(d))
        return std::nullopt;
    return d;
}

std::optional<LonRange> read_bounding_range(const json::object& record)
{
    const json::value* bb = record.if_contains("boundingbox");
    if (!bb || !bb->is_array() || bb->get_array().size() != 4)
        return std::nullopt;

    const json::array& box = bb->get_array();
    auto west = read_degrees(box[2]);
    auto east = read_degrees(box[3]);
    if (!west || !east) {
        LOG_WARN("Ignoring unreadable boundingbox");
        return std::nullopt;
    }
    return LonRange{normalize_edge(*west), normalize_edge(*east)};
}

} // namespace

LonRange correct_whole_globe_range(const LonRange& range, const std::vector<double>& geometry_lons)
{
    if (range.west != MIN_LONGITUDE || range.east != MAX_LONGITUDE)
        return range;

    auto tight = min_covering_interval(geometry_lons);
    if (!tight)
        return range;
    return LonRange{normalize_edge(tight->west), normalize_edge(tight->east)};
}

GeocodeResult parse_nominatim_record(const json::value& record)
{
    if (!record.is_object()) {
        throw GeocodeError("Geocoder record is not a JSON object", __func__);
    }
    const json::object& obj = record.get_object();

    GeocodeResult result;

    const json::value* lon = obj.if_contains("lon");
    std::optional<double> center;
    if (lon)
        center = read_degrees(*lon);
    if (!center) {
        throw GeocodeError("Geocoder record has no usable \"lon\"", __func__,
                           "Records must be Nominatim jsonv2 search results");
    }
    result.center_lon = *center;

    if (const json::value* name = obj.if_contains("display_name"); name && name->is_string()) {
        result.display_name = std::string(name->get_string().data(), name->get_string().size());
    }

    const json::value* geometry = obj.if_contains("geojson");
    if (!geometry)
        geometry = obj.if_contains("geometry");
    if (geometry)
        result.geometry_lons = extract_geometry_longitudes(*geometry);

    if (auto range = read_bounding_range(obj)) {
        const LonRange corrected = correct_whole_globe_range(*range, result.geometry_lons);
        if (corrected != *range) {
            LOG_INFO("Replaced whole-globe bounding box of '", result.display_name,
                     "' by covering interval of ", result.geometry_lons.size(), " outline points");
        }
        result.bounding_range = corrected;
    }
    return result;
}

// =============================================================================
// RecordGeocoder
// =============================================================================

RecordGeocoder::RecordGeocoder(const json::value& records)
{
    if (records.is_array()) {
        for (const auto& record : records.get_array()) {
            add_record(record);
        }
    } else {
        add_record(records);
    }
    LOG_INFO("Loaded ", entries_.size(), " geocoder records");
}

RecordGeocoder RecordGeocoder::from_file(const std::string& path)
{
    return RecordGeocoder(load_json_file(path));
}

void RecordGeocoder::add_record(const json::value& record)
{
    Entry entry;
    entry.result = parse_nominatim_record(record);

    const json::object& obj = record.get_object();
    if (!entry.result.display_name.empty())
        entry.keys.push_back(to_lower(entry.result.display_name));
    if (const json::value* name = obj.if_contains("name"); name && name->is_string()) {
        entry.keys.push_back(to_lower(std::string_view(name->get_string().data(), name->get_string().size())));
    }
    entries_.push_back(std::move(entry));
}

std::optional<GeocodeResult> RecordGeocoder::geocode(const std::string& query)
{
    const std::string needle = to_lower(query);
    if (needle.empty())
        return std::nullopt;

    for (const auto& entry : entries_) {
        for (const auto& key : entry.keys) {
            if (key.find(needle) != std::string::npos) {
                LOG_DEBUG("'", query, "' matched '", entry.result.display_name, "'");
                return entry.result;
            }
        }
    }
    LOG_DEBUG("No record matches '", query, "'");
    return std::nullopt;
}

} // namespace earthzones::geo
