#include "facing_analyzer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

#include "timing.hpp"

CompassResolution parse_compass_resolution(const std::string& value) {
    if (value == "4") return CompassResolution::Four;
    if (value == "8") return CompassResolution::Eight;
    if (value == "16") return CompassResolution::Sixteen;
    throw InvalidConfiguration("Unsupported compass resolution '" + value + "', expected 4, 8 or 16");
}

DistanceUnits parse_distance_units(const std::string& value) {
    if (value == "meters" || value == "m") return DistanceUnits::Meters;
    if (value == "degrees" || value == "deg") return DistanceUnits::Degrees;
    throw InvalidConfiguration("Unsupported distance unit '" + value + "', expected meters or degrees");
}

const char* distance_units_name(DistanceUnits units) {
    switch (units) {
        case DistanceUnits::Meters: return "meters";
        case DistanceUnits::Degrees: return "degrees";
    }
    return "unknown";
}

void AnalyzerConfig::validate() const {
    switch (compass_resolution) {
        case CompassResolution::Four:
        case CompassResolution::Eight:
        case CompassResolution::Sixteen:
            break;
        default:
            throw InvalidConfiguration("Unsupported compass resolution " +
                                       std::to_string(static_cast<int>(compass_resolution)));
    }
    if (!std::isfinite(tie_break_tolerance) || tie_break_tolerance < 0.0) {
        throw InvalidConfiguration("Tie break tolerance must be a non-negative number");
    }
    if (!std::isfinite(max_distance) || max_distance < 0.0) {
        throw InvalidConfiguration("Maximum distance must be a non-negative number");
    }
}


FacingAnalyzer::FacingAnalyzer(AnalyzerConfig config) : _config(config) {
    _config.validate();
}

const AnalyzerConfig& FacingAnalyzer::config() const {
    return _config;
}

RoadIndex FacingAnalyzer::build_index(const std::vector<Road>& roads) const {
    if (!_config.quiet) std::cout << "\tBuilding road index..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    RoadIndex index(_config.tie_break_tolerance);
    index.build(roads);

    auto end = std::chrono::high_resolution_clock::now();
    if (!_config.quiet) {
        size_t skipped = std::count_if(roads.begin(), roads.end(), [](const Road& r) { return r.points.size() < 2; });
        if (skipped > 0) {
            std::cout << "\tWARNING: skipped " << skipped << " roads with less than two vertices" << std::endl;
        }
        std::cout << "\tRoad index built with " << index.num_segments() << " segments from "
                  << index.num_roads() << " roads " << get_duration(end - start) << std::endl;
    }
    return index;
}

std::vector<FacingResult> FacingAnalyzer::analyze(const std::vector<Property>& properties, const std::vector<Road>& roads) const {
    RoadIndex index = build_index(roads);
    return analyze(properties, index);
}

std::vector<FacingResult> FacingAnalyzer::analyze(const std::vector<Property>& properties, const RoadIndex& index) const {
    if (index.empty()) throw NoRoadsIndexed();

    std::vector<FacingResult> results(properties.size());
    if (properties.empty()) return results;

    const NearestRoadMatcher matcher(index);
    const FacingResolver resolver(_config.compass_resolution);

    const size_t total = properties.size();
    size_t threads = _config.threads > 0 ? static_cast<size_t>(_config.threads) : std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
    threads = std::min(threads, total);

    if (!_config.quiet) {
        std::cout << "\tResolving facing for " << total << " properties on " << threads << " threads..." << std::endl;
    }
    auto start = std::chrono::high_resolution_clock::now();

    if (threads <= 1) {
        for (size_t i = 0; i < total; i++) {
            results[i] = resolve_property(properties[i], matcher, resolver);
        }
    } else {
        // Results land at their input position, so completion order does not matter
        std::atomic<size_t> next_index{0};

        auto worker = [&]() {
            for (;;) {
                const size_t i = next_index.fetch_add(1);
                if (i >= total) break;
                results[i] = resolve_property(properties[i], matcher, resolver);
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (size_t t = 0; t < threads; t++) {
            pool.emplace_back(worker);
        }
        for (std::thread& th : pool) {
            if (th.joinable()) th.join();
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    if (!_config.quiet) {
        size_t degraded = std::count_if(results.begin(), results.end(),
                                        [](const FacingResult& r) { return r.status != FacingStatus::Resolved; });
        std::cout << "\tFacing resolved " << get_duration(end - start) << std::endl;
        if (degraded > 0) {
            std::cout << "\tWARNING: " << degraded << " properties could not be fully resolved" << std::endl;
        }
    }

    return results;
}

FacingResult FacingAnalyzer::resolve_property(const Property& property, const RoadIndex& index) const {
    return resolve_property(property, NearestRoadMatcher(index), FacingResolver(_config.compass_resolution));
}

FacingResult FacingAnalyzer::resolve_property(const Property& property, const NearestRoadMatcher& matcher, const FacingResolver& resolver) const {
    const Point location = Point::project_mercator(property.location);
    SegmentMatch match = matcher.match(location);

    const LatLon closest = match.closest.unproject_mercator();
    if (_config.max_distance > 0.0 && haversine_distance(property.location, closest) > _config.max_distance) {
        return FacingResult{property.pid, property.address, "", 0.0, 0.0, "", FacingStatus::NoRoadFound};
    }

    Facing facing = resolver.resolve(location, match);
    return FacingResult{
        property.pid,
        property.address,
        std::move(match.road_id),
        reported_distance(property.location, closest),
        facing.bearing,
        std::move(facing.label),
        facing.status
    };
}

double FacingAnalyzer::reported_distance(const LatLon& from, const LatLon& to) const {
    if (_config.distance_units == DistanceUnits::Degrees) {
        return std::hypot(to.lat - from.lat, to.lon - from.lon);
    }
    return haversine_distance(from, to);
}

std::vector<FacingResult> analyze(const std::vector<Property>& properties, const std::vector<Road>& roads, const AnalyzerConfig& config) {
    return FacingAnalyzer(config).analyze(properties, roads);
}
