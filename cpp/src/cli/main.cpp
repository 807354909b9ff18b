// =============================================================================
// earthzones CLI - Ten-Zone Longitude Partition
// =============================================================================
//
// Usage:
//   earthzones [global options] <command> [args]
//
// Commands:
//   zone      Zone of a longitude ("116.7" or "116.7,39.9")
//   range     Zones covered by a west/east longitude range
//   cover     Minimal covering interval of a set of longitudes
//   zones     List the ten zone intervals
//   place     Resolve a place name through offline geocoder records
//   flatten   Longitudes of a GeoJSON geometry file
//   version   Show version information
//
// Examples:
//   earthzones zone 116.7
//   earthzones range 170 -170
//   earthzones --json cover 10 20 350
//   earthzones place -r records.json "Fiji"
//   earthzones place -r records.json - < queries.txt
//
// =============================================================================

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "earthzones/circular_interval.hpp"
#include "earthzones/config.hpp"
#include "earthzones/error.hpp"
#include "earthzones/format.hpp"
#include "earthzones/geocoder.hpp"
#include "earthzones/geometry.hpp"
#include "earthzones/logging.hpp"
#include "earthzones/longitude.hpp"
#include "earthzones/place.hpp"
#include "earthzones/report.hpp"
#include "earthzones/text_input.hpp"
#include "earthzones/zone_partition.hpp"

namespace earthzones::cli {
    int cmd_zone(int argc, char* argv[]);
    int cmd_range(int argc, char* argv[]);
    int cmd_cover(int argc, char* argv[]);
    int cmd_zones(int argc, char* argv[]);
    int cmd_place(int argc, char* argv[]);
    int cmd_flatten(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define EARTHZONES_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"zone",    "Zone of a longitude", earthzones::cli::cmd_zone},
    {"range",   "Zones covered by a west/east longitude range", earthzones::cli::cmd_range},
    {"cover",   "Minimal covering interval of longitudes", earthzones::cli::cmd_cover},
    {"zones",   "List the ten zone intervals", earthzones::cli::cmd_zones},
    {"place",   "Resolve a place through geocoder records", earthzones::cli::cmd_place},
    {"flatten", "Longitudes of a GeoJSON geometry file", earthzones::cli::cmd_flatten},
    {"version", "Show version information", earthzones::cli::cmd_version},
    {"help",    "Show this help message", earthzones::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string boundary;      // overrides zone.east_boundary when set
    std::string config_file;
    bool json = false;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

using earthzones::Config;
using earthzones::LonRange;
using earthzones::geo::DisplayOptions;
using earthzones::geo::PlaceReport;

DisplayOptions display_options() {
    const Config& config = Config::getInstance();
    DisplayOptions options;
    options.zone_digits = config.get<int>("display.digits", earthzones::DEFAULT_ZONE_DIGITS);
    options.range_digits = config.get<int>("display.range_digits", earthzones::DEFAULT_RANGE_DIGITS);
    return options;
}

// Strict numeric argument: the whole token must be a finite number
std::optional<double> parse_degrees_arg(const char* arg) {
    try {
        std::string text(arg);
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string join_args(int argc, char* argv[]) {
    std::string joined;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) joined += ' ';
        joined += argv[i];
    }
    return joined;
}

// Centre of an arc, used as the representative longitude of a bare range
double arc_midpoint(const LonRange& range) {
    return earthzones::normalize_point(range.west + earthzones::arc_width(range) / 2.0);
}

void print_report(const PlaceReport& report) {
    const DisplayOptions options = display_options();
    if (g_options.json) {
        std::cout << boost::json::serialize(earthzones::geo::to_json(report, options)) << "\n";
    } else {
        std::cout << earthzones::geo::format_place_report(report, options);
    }
}

} // namespace

namespace earthzones::cli {

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "EarthZones - Ten-Zone Longitude Partition (36° per zone)\n";
    std::cout << "Version " << EARTHZONES_VERSION_STRING << "\n\n";
    std::cout << "Usage: earthzones [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 10; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -b, --boundary <lon>    East boundary of zone 9 (default: 116.7)\n";
    std::cout << "  -c, --config <file>     key=value configuration file\n";
    std::cout << "      --json              JSON output\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  EZ_ZONE9_EAST_BOUNDARY  East boundary of zone 9\n";
    std::cout << "  EZ_DISPLAY_DIGITS       Digits in zone intervals (default: 4)\n";
    std::cout << "  EZ_RANGE_DIGITS         Digits in longitude ranges (default: 6)\n";
    std::cout << "  EZ_LOG_LEVEL            debug|info|warn|error|fatal\n";
    std::cout << "  EZ_LOG_FILE             Append log lines to this file\n";
    std::cout << "  EZ_GEOCODER_RECORDS     Saved Nominatim records for 'place'\n";
    std::cout << "\nExamples:\n";
    std::cout << "  earthzones zone 116.7\n";
    std::cout << "  earthzones range 170 -170\n";
    std::cout << "  earthzones --json cover 10 20 350\n";
    std::cout << "  earthzones place -r records.json Fiji\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "EarthZones " << EARTHZONES_VERSION_STRING << "\n";
    std::cout << "Zone 9 east boundary: " << Config::getInstance().zone_scheme().zone9_east_boundary << "\n";
    return 0;
}

// =============================================================================
// Zone Commands
// =============================================================================

int cmd_zone(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: earthzones zone <lon> | <lon,lat>\n";
        return 1;
    }

    const std::string input = join_args(argc, argv);
    auto lon = parse_longitude_text(input);
    if (!lon) {
        std::cerr << "Invalid longitude '" << input << "', use '116.7' or '116.7,39.9'\n";
        return 1;
    }

    print_report(geo::build_point_report(input, *lon, Config::getInstance().zone_scheme()));
    return 0;
}

int cmd_range(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: earthzones range <west> <east>\n";
        std::cerr << "  west > east means the range crosses ±180°\n";
        return 1;
    }

    auto west = parse_degrees_arg(argv[0]);
    auto east = parse_degrees_arg(argv[1]);
    if (!west || !east) {
        std::cerr << "Range ends must be numbers in degrees\n";
        return 1;
    }

    const LonRange range{normalize_edge(*west), normalize_edge(*east)};
    if (is_degenerate(range)) {
        LOG_WARN("Degenerate range ", range.west, " == ", range.east, "; treat it as a point query if no area is meant");
    }

    const std::string query = std::string(argv[0]) + " " + argv[1];
    print_report(geo::build_range_report(query, arc_midpoint(range), range, Config::getInstance().zone_scheme()));
    return 0;
}

int cmd_cover(int argc, char* argv[]) {
    std::vector<double> lons;
    for (int i = 0; i < argc; ++i) {
        auto lon = parse_degrees_arg(argv[i]);
        if (!lon) {
            std::cerr << "Not a longitude: " << argv[i] << "\n";
            return 1;
        }
        lons.push_back(*lon);
    }

    auto cover = min_covering_interval(lons);
    if (!cover) {
        std::cerr << "Usage: earthzones cover <lon> [lon ...]\n";
        return 1;
    }
    LOG_DEBUG("Covering interval of ", lons.size(), " points: ", cover->west, " .. ", cover->east);

    geo::PlaceReport report = geo::build_range_report(join_args(argc, argv), arc_midpoint(*cover), *cover,
                                                      Config::getInstance().zone_scheme());
    report.sample_lon_count = lons.size();
    print_report(report);
    return 0;
}

int cmd_zones([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    ZoneList zones = ZonePartitioner(Config::getInstance().zone_scheme()).intervals();
    std::sort(zones.begin(), zones.end(),
              [](const ZoneInterval& a, const ZoneInterval& b) { return a.zone < b.zone; });

    const DisplayOptions options = display_options();
    if (g_options.json) {
        boost::json::array arr;
        for (const auto& zi : zones) {
            arr.push_back(geo::to_json(zi, options));
        }
        std::cout << boost::json::serialize(arr) << "\n";
        return 0;
    }

    for (const auto& zi : zones) {
        std::cout << "zone " << zi.zone << ": " << pretty_range(zi, options.zone_digits) << "\n";
    }
    return 0;
}

// =============================================================================
// Place / Geometry Commands
// =============================================================================

int cmd_place(int argc, char* argv[]) {
    std::string records_path = Config::getInstance().get<std::string>("geocoder.records");
    std::vector<std::string> words;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-r" || arg == "--records") && i + 1 < argc) {
            records_path = argv[++i];
        } else {
            words.push_back(arg);
        }
    }

    if (words.empty()) {
        std::cerr << "Usage: earthzones place [-r records.json] <place name | lon | ->\n";
        return 1;
    }

    std::unique_ptr<geo::RecordGeocoder> geocoder;
    if (!records_path.empty()) {
        geocoder = std::make_unique<geo::RecordGeocoder>(geo::RecordGeocoder::from_file(records_path));
    }
    const ZoneScheme scheme = Config::getInstance().zone_scheme();

    auto lookup = [&](const std::string& query) {
        auto report = geo::resolve_place(query, scheme, geocoder.get());
        if (!report) {
            if (!geocoder) {
                std::cerr << "'" << query << "' is not a longitude and no geocoder records are configured "
                          << "(use -r or EZ_GEOCODER_RECORDS)\n";
            } else {
                std::cerr << "Place not found: " << query << "\n";
            }
            return false;
        }
        print_report(*report);
        return true;
    };

    // "-" reads one query per line until EOF or q/quit/exit
    if (words.size() == 1 && words[0] == "-") {
        size_t failed = 0;
        std::string line;
        while (std::getline(std::cin, line)) {
            if (is_quit_command(line)) break;
            if (trim(line).empty()) continue;
            if (!lookup(line)) ++failed;
        }
        LOG_DEBUG("Batch lookup finished, ", failed, " unresolved");
        return failed == 0 ? 0 : 1;
    }

    std::string query;
    for (const auto& w : words) {
        if (!query.empty()) query += ' ';
        query += w;
    }
    return lookup(query) ? 0 : 1;
}

int cmd_flatten(int argc, char* argv[]) {
    if (argc != 1) {
        std::cerr << "Usage: earthzones flatten <geometry.json>\n";
        return 1;
    }

    const boost::json::value doc = geo::load_json_file(argv[0]);
    const std::vector<double> lons = doc.is_object()
        ? geo::extract_geometry_longitudes(doc)
        : geo::flatten_longitudes(doc);

    auto cover = min_covering_interval(lons);
    const DisplayOptions options = display_options();

    if (g_options.json) {
        boost::json::object obj;
        boost::json::array arr;
        for (double lon : lons) arr.push_back(lon);
        obj["longitudes"] = std::move(arr);
        if (cover) {
            obj["lon_range"] = boost::json::object{{"west", cover->west}, {"east", cover->east}};
        } else {
            obj["lon_range"] = nullptr;
        }
        std::cout << boost::json::serialize(obj) << "\n";
        return 0;
    }

    std::cout << "points: " << lons.size() << "\n";
    if (cover) {
        std::cout << "lon range: " << pretty_lon_range(*cover, options.range_digits) << "\n";
    } else {
        std::cout << "lon range: (none)\n";
    }
    return 0;
}

} // namespace earthzones::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-b" || arg == "--boundary") && i + 1 < argc) {
            g_options.boundary = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "--json") {
            g_options.json = true;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

bool setup_runtime() {
    if (!earthzones::init_config(g_options.config_file)) {
        return false;
    }

    Config& config = Config::getInstance();
    if (!g_options.boundary.empty()) {
        config.set("zone.east_boundary", g_options.boundary);
    }

    if (g_options.verbose) {
        earthzones::set_log_level(earthzones::LogLevel::DEBUG);
    } else if (g_options.quiet) {
        earthzones::set_log_level(earthzones::LogLevel::ERROR);
    }

    // Surface a bad --boundary before any command runs
    const earthzones::ZoneScheme scheme = config.zone_scheme();
    LOG_DEBUG("Zone 9 east boundary: ", scheme.zone9_east_boundary);
    return true;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        earthzones::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    try {
        if (!setup_runtime()) {
            std::cerr << "Invalid configuration, see log for details.\n";
            return 1;
        }

        for (const Command* cmd = g_commands; cmd->name; ++cmd) {
            if (strcmp(cmd->name, cmd_name) == 0) {
                return cmd->handler(argc, argv);
            }
        }
    } catch (const earthzones::EarthZonesException& e) {
        LOG_ERROR(e.what());
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: ", e.what());
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 2;
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'earthzones help' for usage.\n";
    return 1;
}
