#pragma once

#include <boost/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace earthzones::geo {

/**
 * Collect the longitude of every [lon, lat] pair in a nested coordinate
 * tree, in depth-first order. A pair is an array of exactly two numbers;
 * any other leaf (numbers outside a pair, strings, objects, nulls) is
 * ignored, so 3D positions [lon, lat, alt] contribute nothing.
 */
std::vector<double> flatten_longitudes(const boost::json::value& coordinates);

/**
 * Longitudes of a GeoJSON geometry object: its "coordinates" member, or
 * for a GeometryCollection, the members of each entry of "geometries".
 * Anything that is not an object yields an empty list.
 */
std::vector<double> extract_geometry_longitudes(const boost::json::value& geometry);

/**
 * Parse a JSON document
 * @throws GeometryError if the text is not valid JSON
 */
boost::json::value parse_json_document(std::string_view text);

/**
 * Read and parse a JSON file
 * @throws EarthZonesException (FILE_NOT_FOUND) if the file cannot be read,
 *         GeometryError if it is not valid JSON
 */
boost::json::value load_json_file(const std::string& path);

} // namespace earthzones::geo
