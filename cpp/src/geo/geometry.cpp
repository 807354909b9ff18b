#include "earthzones/geometry.hpp"
#include "earthzones/error.hpp"

#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace earthzones::geo {

namespace {

bool is_coordinate_pair(const json::array& arr)
{
    return arr.size() == 2 && arr[0].is_number() && arr[1].is_number();
}

} // namespace

std::vector<double> flatten_longitudes(const json::value& coordinates)
{
    std::vector<double> lons;

    // Explicit DFS; children are pushed in reverse so output keeps document order
    std::vector<const json::value*> stack;
    stack.push_back(&coordinates);

    while (!stack.empty()) {
        const json::value* node = stack.back();
        stack.pop_back();

        if (!node->is_array())
            continue;

        const json::array& arr = node->get_array();
        if (is_coordinate_pair(arr)) {
            lons.push_back(arr[0].to_number<double>());
            continue;
        }
        for (auto it = arr.rbegin(); it != arr.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
    return lons;
}

std::vector<double> extract_geometry_longitudes(const json::value& geometry)
{
    std::vector<double> lons;
    if (!geometry.is_object())
        return lons;

    const json::object& obj = geometry.get_object();
    if (const json::value* coords = obj.if_contains("coordinates")) {
        return flatten_longitudes(*coords);
    }

    if (const json::value* members = obj.if_contains("geometries")) {
        if (members->is_array()) {
            for (const auto& member : members->get_array()) {
                std::vector<double> part = extract_geometry_longitudes(member);
                lons.insert(lons.end(), part.begin(), part.end());
            }
        }
    }
    return lons;
}

json::value parse_json_document(std::string_view text)
{
    boost::system::error_code ec;
    json::value doc = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw GeometryError("Malformed JSON: " + ec.message(), __func__,
                            "Check that the document is a complete JSON value");
    }
    return doc;
}

json::value load_json_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw EarthZonesException(ErrorCode::FILE_NOT_FOUND, "Cannot open: " + path, __func__);
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return parse_json_document(buf.str());
}

} // namespace earthzones::geo
