#include <chrono>
#include <cstddef>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <osmium/io/any_input.hpp>
#include <osmium/osm/area.hpp>
#include <osmium/visitor.hpp>
#include <osmium/area/assembler.hpp>
#include <osmium/area/multipolygon_manager.hpp>
#include <osmium/index/map/flex_mem.hpp>
#include <osmium/handler/node_locations_for_ways.hpp>

#include "httplib.h"
#include "clipp.h"
#include "geo_data.hpp"
#include "geometry.hpp"
#include "idataset.hpp"
#include "osm_handler.hpp"
#include "road_index.hpp"
#include "facing_analyzer.hpp"
#include "report.hpp"
#include "timing.hpp"

static const int DEFAULT_PORT = 8080;
using index_type = osmium::index::map::FlexMem<osmium::unsigned_object_id_type, osmium::Location>;
using location_handler_type = osmium::handler::NodeLocationsForWays<index_type>;

struct Configuration {
    public:
        std::string input_file;
        std::optional<std::string> properties_file;
        bool in_binary_file = false;
        bool help = false;
        bool serve = false;
        std::optional<std::string> out_binary_file;
        std::optional<std::string> report_file;
        int port = DEFAULT_PORT;
        AnalyzerConfig analyzer;
};

static void parse_osm(const std::string& path, Dataset& dataset) {
    osmium::io::File input_file(path);

    // Create areas out of multipolygons
    osmium::area::Assembler::config_type assembler_config;
    assembler_config.create_empty_areas = false;

    osmium::area::MultipolygonManager<osmium::area::Assembler> mp_manager{assembler_config};
    osmium::relations::read_relations(input_file, mp_manager);

    index_type index;
    location_handler_type location_handler{index};
    location_handler.ignore_errors();

    OSMHandler handler(dataset);
    osmium::io::Reader reader{input_file, osmium::io::read_meta::no};
    osmium::apply(reader, location_handler, handler, mp_manager.handler([&handler](const osmium::memory::Buffer& area_buffer) {
        osmium::apply(area_buffer, handler);
    }));
    reader.close();
}

static void serve_report(const Configuration& configuration, const FacingAnalyzer& analyzer,
                         const RoadIndex& index, const std::string& report) {
    httplib::Server svr;

    svr.Get("/", [&report](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
        res.set_header("Content-Disposition", "attachment; filename=orientation_report.csv");
        res.set_content(report, "text/csv");
    });

    // Ad hoc lookup for a single coordinate
    svr.Get("/facing", [&analyzer, &index](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("lat") || !req.has_param("lon")) {
            res.status = 400;
            res.set_content("Expected lat and lon parameters", "text/plain");
            return;
        }

        double lat, lon;
        try {
            lat = std::stod(req.get_param_value("lat"));
            lon = std::stod(req.get_param_value("lon"));
        } catch (const std::exception&) {
            res.status = 400;
            res.set_content("Invalid coordinate", "text/plain");
            return;
        }
        if (!is_valid_coordinate(lat, lon)) {
            res.status = 400;
            res.set_content("Coordinate out of range", "text/plain");
            return;
        }

        try {
            Property property(req.get_param_value("pid"), req.get_param_value("address"), LatLon(lat, lon));
            std::vector<FacingResult> results{analyzer.resolve_property(property, index)};
            res.status = 200;
            res.set_content(report_csv_string(results, analyzer.config().distance_units), "text/csv");
        } catch (const std::exception& e) {
            res.status = 500;
            res.set_content(std::string("Analysis failed: ") + e.what(), "text/plain");
        }
    });

    std::cout << "Server started at http://localhost:" << configuration.port << std::endl;
    svr.listen("localhost", configuration.port);
}

static int run(const Configuration& configuration) {
    const FacingAnalyzer analyzer(configuration.analyzer);

    Dataset dataset;
    RoadIndex index;

    if (configuration.in_binary_file) {
        std::cout << "Loading road index from " << configuration.input_file << "..." << std::endl;
        auto start_load = std::chrono::high_resolution_clock::now();

        index = RoadIndex::load(configuration.input_file);

        auto end_load = std::chrono::high_resolution_clock::now();
        std::cout << "Loaded road index " << get_duration(end_load - start_load) << std::endl;
    } else {
        std::cout << "Parsing " << configuration.input_file << "..." << std::endl;
        auto start_parsing = std::chrono::high_resolution_clock::now();

        parse_osm(configuration.input_file, dataset);

        auto end_parsing = std::chrono::high_resolution_clock::now();
        std::cout << "Parsing done " << get_duration(end_parsing - start_parsing) << std::endl;
    }

    if (configuration.properties_file) {
        std::cout << "Loading properties from " << *configuration.properties_file << "..." << std::endl;
        dataset.set_properties(load_properties_csv(*configuration.properties_file));
    } else if (configuration.in_binary_file) {
        std::cerr << "Error: a properties file is required together with a binary index" << std::endl;
        return 1;
    }

    std::cout << "Number of properties: " << dataset.num_properties() << std::endl;
    if (!configuration.in_binary_file) {
        std::cout << "Number of roads: " << dataset.num_roads() << std::endl;
    }

    std::cout << "Analyzing..." << std::endl;
    auto start_analysis = std::chrono::high_resolution_clock::now();

    if (!configuration.in_binary_file) {
        index = analyzer.build_index(dataset.roads());
    }
    std::vector<FacingResult> results = analyzer.analyze(dataset.properties(), index);

    auto end_analysis = std::chrono::high_resolution_clock::now();
    std::cout << "Analysis done " << get_duration(end_analysis - start_analysis) << std::endl;

    // Serialize the index if argument is set
    if (configuration.out_binary_file) {
        std::cout << "Serializing road index to " << *configuration.out_binary_file << "..." << std::endl;
        auto start_ser = std::chrono::high_resolution_clock::now();

        index.save(*configuration.out_binary_file);

        auto end_ser = std::chrono::high_resolution_clock::now();
        std::cout << "Serialization done " << get_duration(end_ser - start_ser) << std::endl;
    }

    const std::string report = report_csv_string(results, configuration.analyzer.distance_units);

    if (configuration.report_file) {
        std::ofstream ofs(*configuration.report_file);
        if (!ofs.is_open()) {
            std::cerr << "Error: Cannot open report file " << *configuration.report_file << std::endl;
            return 1;
        }
        ofs << report;
        std::cout << "Report written to " << *configuration.report_file << std::endl;
    } else if (!configuration.serve) {
        std::cout << report;
    }

    if (configuration.serve) {
        serve_report(configuration, analyzer, index, report);
    }

    return 0;
}

int main(int argc, char* argv[]) {
    Configuration configuration;
    std::string resolution = "8";
    std::string units = "meters";

    // Command line parsing
    auto cli = (
        clipp::option("-h", "--help").set(configuration.help).doc("Print this help"),

        (clipp::option("-r", "--resolution") & clipp::value("4|8|16", resolution))
            .doc("Compass resolution. DEFAULT = 8"),

        (clipp::option("-u", "--units") & clipp::value("meters|degrees", units))
            .doc("Units of the reported distance. DEFAULT = meters"),

        (clipp::option("-t", "--tolerance") & clipp::value("tolerance", configuration.analyzer.tie_break_tolerance))
            .doc("Relative tolerance below which two roads count as equally near"),

        (clipp::option("-d", "--max_distance") & clipp::value("meters", configuration.analyzer.max_distance))
            .doc("Report no road for properties farther away than this. DEFAULT = no limit"),

        (clipp::option("-j", "--threads") & clipp::value("threads", configuration.analyzer.threads))
            .doc("Worker threads. DEFAULT = all cores"),

        clipp::option("-bi", "--binary_in")
            .set(configuration.in_binary_file)
            .doc("Input file is a binary road index"),

        (clipp::option("-bo", "--binary_out") &
        clipp::value("index file", [&configuration](const std::string& path) {
                configuration.out_binary_file = path;
                return true;
            })).doc("Optional path to output binary road index"),

        (clipp::option("-o", "--output") &
        clipp::value("report file", [&configuration](const std::string& path) {
                configuration.report_file = path;
                return true;
            })).doc("Write the CSV report to this file instead of stdout"),

        clipp::option("-s", "--serve").set(configuration.serve).doc("Serve the report over HTTP"),

        (clipp::option("-p", "--port") & clipp::value("port", configuration.port))
            .doc(std::string("Port number for the localhost. DEFAULT = ") + std::to_string(DEFAULT_PORT)),

        clipp::value("roads file", configuration.input_file).doc("Path to OSM file or binary road index"),

        clipp::opt_value("properties file", [&configuration](const std::string& path) {
            configuration.properties_file = path;
            return true;
        }).doc("CSV with PID,Address,Latitude,Longitude. DEFAULT = addressed buildings of the OSM file")
    );

    if (!clipp::parse(argc, argv, cli, true) || configuration.help) {
        std::cout << clipp::make_man_page(cli, argv[0]);
        return 1;
    }

    try {
        configuration.analyzer.compass_resolution = parse_compass_resolution(resolution);
        configuration.analyzer.distance_units = parse_distance_units(units);
        return run(configuration);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
