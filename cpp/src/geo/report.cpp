#include "earthzones/report.hpp"

#include <sstream>

namespace json = boost::json;

namespace earthzones::geo {

std::string format_place_report(const PlaceReport& report, const DisplayOptions& options)
{
    std::ostringstream out;

    if (!report.note.empty())
        out << "note: " << report.note << "\n";
    out << "input: " << report.query << "\n";

    if (report.bounding_range) {
        out << "  lon range: " << pretty_lon_range(*report.bounding_range, options.range_digits) << "\n";
    } else {
        out << "  point lon: " << format_degrees(report.center_lon, options.range_digits) << "\n";
    }

    if (!report.covered_zones.empty()) {
        out << "  covered zones: " << format_zone_list(report.covered_zones) << "\n";
        for (const auto& zi : report.covered_zones) {
            out << "    - zone " << zi.zone << ": " << pretty_range(zi, options.zone_digits) << "\n";
        }
    } else {
        out << "  zone: " << report.center_zone.zone << "\n";
        out << "  interval: " << pretty_range(report.center_zone, options.zone_digits) << "\n";
    }
    return out.str();
}

json::object to_json(const ZoneInterval& zi, const DisplayOptions& options)
{
    json::object obj;
    obj["zone"] = zi.zone;
    obj["interval"] = json::object{{"west", zi.west}, {"east", zi.east}};
    obj["interval_text"] = pretty_range(zi, options.zone_digits);
    return obj;
}

json::object to_json(const PlaceReport& report, const DisplayOptions& options)
{
    json::object obj;
    obj["query"] = report.query;
    obj["center_lon"] = report.center_lon;
    obj["center_zone"] = to_json(report.center_zone, options);

    if (report.bounding_range) {
        obj["lon_range"] = json::object{
            {"west", report.bounding_range->west},
            {"east", report.bounding_range->east},
            {"range_text", pretty_lon_range(*report.bounding_range, options.range_digits)},
        };
    } else {
        obj["lon_range"] = nullptr;
    }
    obj["degenerate"] = report.degenerate_range;

    if (report.note.empty()) {
        obj["note"] = nullptr;
    } else {
        obj["note"] = report.note;
    }

    json::array zones_list;
    json::array zones;
    for (const auto& zi : report.covered_zones) {
        zones_list.push_back(zi.zone);
        zones.push_back(to_json(zi, options));
    }
    obj["zones_list"] = std::move(zones_list);
    obj["zones"] = std::move(zones);
    obj["sample_lon_count"] = report.sample_lon_count;
    return obj;
}

} // namespace earthzones::geo
