// =============================================================================
// Place Resolution and Report Tests
// =============================================================================

#include <gtest/gtest.h>
#include "earthzones/geocoder.hpp"
#include "earthzones/place.hpp"
#include "earthzones/report.hpp"
#include <boost/json.hpp>
#include <string>
#include <vector>

using namespace earthzones;
using namespace earthzones::geo;
namespace json = boost::json;

namespace {

const char* PLACE_RECORDS = R"([
    {
        "name": "Fiji", "display_name": "Fiji", "lon": "178.0",
        "boundingbox": ["-21.0", "-12.0", "-180.0", "180.0"],
        "geojson": {"type": "MultiPolygon", "coordinates": [
            [[[177.0, -17.0], [178.0, -18.0], [179.0, -17.5]]],
            [[[-179.0, -16.5], [-178.0, -16.0]]]
        ]}
    },
    {
        "name": "Langfang", "display_name": "Langfang, Hebei, China", "lon": "116.68",
        "boundingbox": ["39.1", "40.0", "116.1", "117.2"]
    },
    {
        "name": "Null Island", "display_name": "Null Island", "lon": "0",
        "boundingbox": ["0", "0", "5", "5"]
    }
])";

// Records what it was asked and answers with a fixed match
class FakeGeocoder : public Geocoder {
public:
    std::optional<GeocodeResult> geocode(const std::string& query) override {
        queries.push_back(query);
        GeocodeResult r;
        r.display_name = "Somewhere";
        r.center_lon = -74.006;
        return r;
    }

    std::vector<std::string> queries;
};

std::vector<int> numbers(const ZoneList& zones) {
    std::vector<int> out;
    for (const auto& zi : zones) out.push_back(zi.zone);
    return out;
}

} // namespace

class PlaceTest : public ::testing::Test {
protected:
    PlaceTest() : geocoder(json::parse(PLACE_RECORDS)) {}

    ZoneScheme scheme;
    RecordGeocoder geocoder;
};

TEST_F(PlaceTest, LongitudeTextNeedsNoGeocoder) {
    auto report = resolve_place("100.0", scheme);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->query, "100.0");
    EXPECT_EQ(report->center_lon, 100.0);
    EXPECT_EQ(report->center_zone.zone, 9);
    EXPECT_FALSE(report->bounding_range.has_value());
    EXPECT_TRUE(report->covered_zones.empty());
    EXPECT_TRUE(report->note.empty());
}

TEST_F(PlaceTest, NameWithoutGeocoderIsUnresolved) {
    EXPECT_FALSE(resolve_place("Fiji", scheme).has_value());
    EXPECT_FALSE(resolve_place("Atlantis", scheme, &geocoder).has_value());
}

TEST_F(PlaceTest, GeocodedPlaceAcrossAntimeridian) {
    auto report = resolve_place("Fiji", scheme, &geocoder);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->note, "matched: Fiji");
    EXPECT_EQ(report->center_zone.zone, 7);
    ASSERT_TRUE(report->bounding_range.has_value());
    EXPECT_EQ(*report->bounding_range, (LonRange{177.0, -178.0}));
    EXPECT_FALSE(report->degenerate_range);
    EXPECT_EQ(numbers(report->covered_zones), (std::vector<int>{7}));
    EXPECT_EQ(report->sample_lon_count, 5u);
}

TEST_F(PlaceTest, GeocodedPlaceSpanningTwoZones) {
    auto report = resolve_place("langfang", scheme, &geocoder);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->center_zone.zone, 9);
    EXPECT_EQ(numbers(report->covered_zones), (std::vector<int>{8, 9}));
    EXPECT_EQ(report->sample_lon_count, 0u);
}

TEST_F(PlaceTest, DegenerateRangeIsFlagged) {
    auto report = resolve_place("null island", scheme, &geocoder);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->degenerate_range);
    EXPECT_EQ(numbers(report->covered_zones), (std::vector<int>{2}));

    PlaceReport direct = build_range_report("x", 0.0, LonRange{10.0, 20.0}, scheme);
    EXPECT_FALSE(direct.degenerate_range);
}

TEST_F(PlaceTest, GeocoderSeesTrimmedQuery) {
    FakeGeocoder fake;
    auto report = resolve_place("  New York  ", scheme, &fake);
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(fake.queries.size(), 1u);
    EXPECT_EQ(fake.queries[0], "New York");
    EXPECT_EQ(report->query, "  New York  ");
    EXPECT_EQ(report->center_zone.zone, 4);
    EXPECT_FALSE(report->bounding_range.has_value());
    EXPECT_EQ(report->note, "matched: Somewhere");

    // Longitude text never reaches the geocoder
    resolve_place("116.7,39.9", scheme, &fake);
    EXPECT_EQ(fake.queries.size(), 1u);
}

TEST_F(PlaceTest, RangeEdgesAreNormalized) {
    PlaceReport report = build_range_report("wrapped", 185.0, LonRange{530.0, 190.0}, scheme);
    EXPECT_EQ(report.center_lon, -175.0);
    ASSERT_TRUE(report.bounding_range.has_value());
    EXPECT_EQ(*report.bounding_range, (LonRange{170.0, -170.0}));
    EXPECT_EQ(numbers(report.covered_zones), (std::vector<int>{6, 7}));
}

TEST_F(PlaceTest, AlternateScheme) {
    auto report = resolve_place("Fiji", ZoneScheme{0.0}, &geocoder);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(numbers(report->covered_zones), (std::vector<int>{3, 4}));
}

// =============================================================================
// Presentation
// =============================================================================

TEST_F(PlaceTest, PointReportText) {
    PlaceReport report = build_point_report("100", 100.0, scheme);
    const std::string text = format_place_report(report);
    EXPECT_EQ(text,
              "input: 100\n"
              "  point lon: 100.000000°\n"
              "  zone: 9\n"
              "  interval: [80.7000°, 116.7000°)\n");
}

TEST_F(PlaceTest, RangeReportText) {
    auto report = resolve_place("Fiji", scheme, &geocoder);
    ASSERT_TRUE(report.has_value());
    const std::string text = format_place_report(*report, DisplayOptions{1, 1});
    EXPECT_EQ(text,
              "note: matched: Fiji\n"
              "input: Fiji\n"
              "  lon range: crosses ±180°: [177.0°, 180.0°] ∪ [-180.0°, -178.0°]\n"
              "  covered zones: 7\n"
              "    - zone 7: crosses ±180°: [152.7°, 180.0°) ∪ [-180.0°, -171.3°)\n");
}

TEST_F(PlaceTest, JsonForPoint) {
    json::object obj = to_json(build_point_report("100", 100.0, scheme));
    EXPECT_EQ(std::string(obj.at("query").as_string().c_str()), "100");
    EXPECT_EQ(obj.at("center_lon").as_double(), 100.0);
    EXPECT_EQ(obj.at("center_zone").as_object().at("zone").as_int64(), 9);
    EXPECT_TRUE(obj.at("lon_range").is_null());
    EXPECT_TRUE(obj.at("note").is_null());
    EXPECT_FALSE(obj.at("degenerate").as_bool());
    EXPECT_TRUE(obj.at("zones_list").as_array().empty());
    EXPECT_EQ(obj.at("sample_lon_count").to_number<int>(), 0);
}

TEST_F(PlaceTest, JsonForRange) {
    auto report = resolve_place("Fiji", scheme, &geocoder);
    ASSERT_TRUE(report.has_value());
    json::object obj = to_json(*report);

    const json::object& range = obj.at("lon_range").as_object();
    EXPECT_EQ(range.at("west").as_double(), 177.0);
    EXPECT_EQ(range.at("east").as_double(), -178.0);
    EXPECT_EQ(std::string(obj.at("note").as_string().c_str()), "matched: Fiji");

    const json::array& zones_list = obj.at("zones_list").as_array();
    ASSERT_EQ(zones_list.size(), 1u);
    EXPECT_EQ(zones_list[0].as_int64(), 7);

    const json::array& zones = obj.at("zones").as_array();
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].as_object().at("zone").as_int64(), 7);
    EXPECT_TRUE(zones[0].as_object().at("interval").is_object());
    EXPECT_EQ(obj.at("sample_lon_count").to_number<int>(), 5);
}
