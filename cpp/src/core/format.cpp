#include "earthzones/format.hpp"
#include "earthzones/circular_interval.hpp"

#include <iomanip>
#include <sstream>

namespace earthzones {

std::string format_degrees(double value, int digits)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(digits) << value << "°";
    return ss.str();
}

std::string pretty_range(double west, double east, int digits)
{
    const SegmentList parts = split_range(west, east);
    if (parts.size() == 1) {
        return "[" + format_degrees(parts[0].a, digits) + ", " + format_degrees(parts[0].b, digits) + ")";
    }
    return "crosses ±180°: [" + format_degrees(parts[0].a, digits) + ", " +
           format_degrees(MAX_LONGITUDE, digits) + ") ∪ [" +
           format_degrees(MIN_LONGITUDE, digits) + ", " + format_degrees(parts[1].b, digits) + ")";
}

std::string pretty_lon_range(double west, double east, int digits)
{
    if (west == east) {
        return "[" + format_degrees(west, digits) + ", " + format_degrees(east, digits) +
               "] (endpoints coincide: degenerate or incomplete bounding range)";
    }

    const SegmentList parts = split_range(west, east);
    if (parts.size() == 1) {
        return "[" + format_degrees(parts[0].a, digits) + ", " + format_degrees(parts[0].b, digits) + "]";
    }
    return "crosses ±180°: [" + format_degrees(parts[0].a, digits) + ", " +
           format_degrees(MAX_LONGITUDE, digits) + "] ∪ [" +
           format_degrees(MIN_LONGITUDE, digits) + ", " + format_degrees(parts[1].b, digits) + "]";
}

std::string format_zone_list(const ZoneList& zones)
{
    std::ostringstream ss;
    for (size_t i = 0; i < zones.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << zones[i].zone;
    }
    return ss.str();
}

} // namespace earthzones
