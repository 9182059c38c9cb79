#include "facing_analyzer.hpp"
#include "facing_resolver.hpp"
#include "report.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <random>
#include <string>
#include <vector>

namespace facing_tests {

AnalyzerConfig quiet_config() {
    AnalyzerConfig config;
    config.quiet = true;
    return config;
}

Facing resolve_against(const std::vector<Road>& roads, const LatLon& location, CompassResolution resolution) {
    RoadIndex index;
    index.build(roads);
    Property property("p", "", location);
    SegmentMatch match = NearestRoadMatcher(index).match(property);
    return FacingResolver(resolution).resolve(property, match);
}

bool test_north_of_east_west_road() {
    std::vector<Road> roads = {Road("ew", {LatLon(0, 0), LatLon(0, 0.002)})};
    LatLon north_of_midpoint(0.001, 0.001);

    Facing four = resolve_against(roads, north_of_midpoint, CompassResolution::Four);
    Facing eight = resolve_against(roads, north_of_midpoint, CompassResolution::Eight);
    if (four.label != "N" || eight.label != "N" || four.status != FacingStatus::Resolved) {
        std::cerr << "Expected N, got " << four.label << " and " << eight.label << std::endl;
        return false;
    }
    return std::fabs(eight.bearing) < 1e-6 || std::fabs(eight.bearing - 360.0) < 1e-6;
}

bool test_south_of_east_west_road() {
    std::vector<Road> roads = {Road("ew", {LatLon(0, 0), LatLon(0, 0.002)})};
    Facing facing = resolve_against(roads, LatLon(-0.001, 0.001), CompassResolution::Eight);
    return facing.label == "S" && std::fabs(facing.bearing - 180.0) < 1e-6;
}

bool test_east_of_north_running_road() {
    // Same answer whichever way the road was digitized
    std::vector<Road> northward = {Road("ns", {LatLon(0, 0), LatLon(0.01, 0)})};
    std::vector<Road> southward = {Road("sn", {LatLon(0.01, 0), LatLon(0, 0)})};
    LatLon east(0.005, 0.005);

    Facing a = resolve_against(northward, east, CompassResolution::Eight);
    Facing b = resolve_against(southward, east, CompassResolution::Eight);
    return a.label == "E" && b.label == "E" &&
           std::fabs(a.bearing - 90.0) < 1e-6 && std::fabs(b.bearing - 90.0) < 1e-6;
}

bool test_diagonal_road() {
    // Road running north-east, property on its north-west side
    std::vector<Road> roads = {Road("diag", {LatLon(0, 0), LatLon(0.01, 0.01)})};
    Facing facing = resolve_against(roads, LatLon(0.006, 0.004), CompassResolution::Eight);
    return facing.label == "NW" && facing.status == FacingStatus::Resolved;
}

bool test_property_on_road_is_ambiguous() {
    std::vector<Road> roads = {Road("ew", {LatLon(0, 0), LatLon(0, 0.002)})};
    Facing facing = resolve_against(roads, LatLon(0, 0), CompassResolution::Eight);

    // Road heads east, the fallback is road bearing + 90
    return facing.status == FacingStatus::AmbiguousResolution && facing.label == "S" &&
           std::fabs(facing.bearing - 180.0) < 1e-6;
}

bool test_property_past_road_end_is_ambiguous() {
    // On the road's axis beyond its east end, both sides are equally far
    std::vector<Road> roads = {Road("ew", {LatLon(0, 0), LatLon(0, 0.002)})};
    const LatLon on_axis[] = {LatLon(0, 0.003), LatLon(1e-12, 0.003), LatLon(-1e-12, 0.003)};
    for (const LatLon& location : on_axis) {
        Facing facing = resolve_against(roads, location, CompassResolution::Eight);
        if (facing.status != FacingStatus::AmbiguousResolution || facing.label != "S" ||
            std::fabs(facing.bearing - 180.0) > 1e-6) {
            std::cerr << "Expected ambiguous S at lat " << location.lat << ", got " << facing.label << " "
                      << facing_status_name(facing.status) << std::endl;
            return false;
        }
    }

    // Clearly off the axis the side is known again
    Facing north = resolve_against(roads, LatLon(0.0001, 0.003), CompassResolution::Eight);
    return north.status == FacingStatus::Resolved && north.label == "N";
}

bool test_degenerate_road_faces_the_point() {
    std::vector<Road> roads = {Road("dot", {LatLon(0, 0), LatLon(0, 0)})};
    Facing facing = resolve_against(roads, LatLon(0.001, 0), CompassResolution::Four);
    if (facing.status != FacingStatus::DegenerateSegment || facing.label != "S") {
        std::cerr << "Expected degenerate S, got " << facing.label << std::endl;
        return false;
    }

    Facing on_point = resolve_against(roads, LatLon(0, 0), CompassResolution::Four);
    return on_point.status == FacingStatus::DegenerateSegment && on_point.bearing == 0.0;
}

bool test_analyze_empty_properties() {
    std::vector<Road> roads = {Road("ew", {LatLon(0, 0), LatLon(0, 0.002)})};
    std::vector<FacingResult> results = analyze({}, roads, quiet_config());
    return results.empty();
}

bool test_analyze_without_roads_fails() {
    std::vector<Property> properties = {Property("1", "1 Main St", LatLon(0, 0))};
    try {
        analyze(properties, {}, quiet_config());
        return false;
    } catch (const NoRoadsIndexed&) {
    }

    try {
        analyze({}, {}, quiet_config());
        return false;
    } catch (const NoRoadsIndexed&) {
    }
    return true;
}

bool test_analyze_fills_result_fields() {
    std::vector<Road> roads = {
        Road("main", {LatLon(0, 0), LatLon(0, 0.002)}),
        Road("side", {LatLon(0.01, 0), LatLon(0.02, 0)}),
    };
    std::vector<Property> properties = {
        Property("10", "10 Main St", LatLon(0.0002, 0.001)),
        Property("11", "11 Side St", LatLon(0.015, -0.0003)),
    };

    std::vector<FacingResult> results = analyze(properties, roads, quiet_config());
    if (results.size() != 2) return false;

    const FacingResult& main_st = results[0];
    const FacingResult& side_st = results[1];

    // 0.0002 degrees of latitude is a little over 22 meters
    bool main_ok = main_st.pid == "10" && main_st.address == "10 Main St" && main_st.road_id == "main" &&
                   main_st.label == "N" && main_st.status == FacingStatus::Resolved &&
                   std::fabs(main_st.distance - 22.239) < 0.05;
    bool side_ok = side_st.pid == "11" && side_st.road_id == "side" && side_st.label == "W";

    if (!main_ok || !side_ok) {
        std::cerr << "Unexpected results: " << main_st.road_id << " " << main_st.label << " " << main_st.distance
                  << ", " << side_st.road_id << " " << side_st.label << std::endl;
        return false;
    }
    return true;
}

bool test_distance_in_degrees() {
    AnalyzerConfig config = quiet_config();
    config.distance_units = DistanceUnits::Degrees;

    std::vector<Road> roads = {Road("main", {LatLon(0, 0), LatLon(0, 0.002)})};
    std::vector<Property> properties = {Property("1", "", LatLon(0.0002, 0.001))};
    std::vector<FacingResult> results = analyze(properties, roads, config);
    return results.size() == 1 && std::fabs(results[0].distance - 0.0002) < 1e-9;
}

bool test_max_distance_reports_no_road() {
    AnalyzerConfig config = quiet_config();
    config.max_distance = 100.0;

    std::vector<Road> roads = {Road("main", {LatLon(0, 0), LatLon(0, 0.002)})};
    std::vector<Property> properties = {
        Property("near", "", LatLon(0.0005, 0.001)),
        Property("far", "", LatLon(0.01, 0.001)),
    };
    std::vector<FacingResult> results = analyze(properties, roads, config);

    return results.size() == 2 &&
           results[0].status == FacingStatus::Resolved && results[0].road_id == "main" &&
           results[1].status == FacingStatus::NoRoadFound && results[1].road_id.empty() &&
           results[1].label.empty() && results[1].pid == "far";
}

std::vector<Property> random_properties(std::mt19937& rng, size_t count) {
    std::uniform_real_distribution<double> lat(-0.01, 0.01);
    std::uniform_real_distribution<double> lon(-0.01, 0.01);
    std::vector<Property> properties;
    for (size_t i = 0; i < count; i++) {
        properties.emplace_back("P" + std::to_string(i), std::to_string(i) + " Some St", LatLon(lat(rng), lon(rng)));
    }
    return properties;
}

std::vector<Road> grid_roads() {
    std::vector<Road> roads;
    for (int i = -5; i <= 5; i++) {
        double offset = i * 0.002;
        roads.emplace_back("ew" + std::to_string(i), std::vector<LatLon>{LatLon(offset, -0.01), LatLon(offset, 0.0), LatLon(offset + 0.0003, 0.01)});
        roads.emplace_back("ns" + std::to_string(i), std::vector<LatLon>{LatLon(-0.01, offset), LatLon(0.01, offset + 0.0001)});
    }
    return roads;
}

bool test_order_preserved_across_threads() {
    std::mt19937 rng(7);
    std::vector<Property> properties = random_properties(rng, 5000);
    std::vector<Road> roads = grid_roads();

    AnalyzerConfig config = quiet_config();
    config.threads = 8;
    std::vector<FacingResult> results = analyze(properties, roads, config);

    if (results.size() != properties.size()) return false;
    for (size_t i = 0; i < properties.size(); i++) {
        if (results[i].pid != properties[i].pid) {
            std::cerr << "Result " << i << " belongs to " << results[i].pid << std::endl;
            return false;
        }
    }
    return true;
}

bool test_repeated_runs_are_identical() {
    std::mt19937 rng(11);
    std::vector<Property> properties = random_properties(rng, 2000);
    std::vector<Road> roads = grid_roads();

    AnalyzerConfig single = quiet_config();
    single.threads = 1;
    AnalyzerConfig parallel = quiet_config();
    parallel.threads = 4;

    std::string first = report_csv_string(analyze(properties, roads, single), DistanceUnits::Meters);
    std::string second = report_csv_string(analyze(properties, roads, single), DistanceUnits::Meters);
    std::string third = report_csv_string(analyze(properties, roads, parallel), DistanceUnits::Meters);
    return first == second && first == third;
}

bool test_invalid_config_rejected() {
    AnalyzerConfig config = quiet_config();
    config.tie_break_tolerance = -1.0;
    try {
        FacingAnalyzer analyzer(config);
        return false;
    } catch (const InvalidConfiguration&) {
    }

    config = quiet_config();
    config.compass_resolution = static_cast<CompassResolution>(12);
    try {
        FacingAnalyzer analyzer(config);
        return false;
    } catch (const InvalidConfiguration&) {
    }
    return true;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"north_of_east_west_road", &test_north_of_east_west_road},
        {"south_of_east_west_road", &test_south_of_east_west_road},
        {"east_of_north_running_road", &test_east_of_north_running_road},
        {"diagonal_road", &test_diagonal_road},
        {"property_on_road_is_ambiguous", &test_property_on_road_is_ambiguous},
        {"property_past_road_end_is_ambiguous", &test_property_past_road_end_is_ambiguous},
        {"degenerate_road_faces_the_point", &test_degenerate_road_faces_the_point},
        {"analyze_empty_properties", &test_analyze_empty_properties},
        {"analyze_without_roads_fails", &test_analyze_without_roads_fails},
        {"analyze_fills_result_fields", &test_analyze_fills_result_fields},
        {"distance_in_degrees", &test_distance_in_degrees},
        {"max_distance_reports_no_road", &test_max_distance_reports_no_road},
        {"order_preserved_across_threads", &test_order_preserved_across_threads},
        {"repeated_runs_are_identical", &test_repeated_runs_are_identical},
        {"invalid_config_rejected", &test_invalid_config_rejected},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace facing_tests

int main() {
    if (facing_tests::run_all_tests()) {
        std::cout << "All facing tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Facing tests failed" << std::endl;
    return 1;
}
