#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "geo_data.hpp"
#include "geometry.hpp"
#include "road_index.hpp"
#include "nearest_road_matcher.hpp"
#include "facing_resolver.hpp"

enum class DistanceUnits : uint8_t {
    Meters,
    Degrees
};

class InvalidConfiguration : public std::invalid_argument {
    public:
        explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) { }
};

CompassResolution parse_compass_resolution(const std::string& value);
DistanceUnits parse_distance_units(const std::string& value);
const char* distance_units_name(DistanceUnits units);

struct AnalyzerConfig {
    public:
        CompassResolution compass_resolution = CompassResolution::Eight;
        DistanceUnits distance_units = DistanceUnits::Meters;
        double tie_break_tolerance = DEFAULT_TIE_BREAK_TOLERANCE;
        double max_distance = 0.0;  // Meters, 0 disables the filter
        int threads = 0;            // <= 0 uses all hardware threads
        bool quiet = false;

        void validate() const;
};

struct FacingResult {
    std::string pid;
    std::string address;
    std::string road_id;
    double distance;
    double bearing;
    std::string label;
    FacingStatus status;
};

class FacingAnalyzer {
    public:
        explicit FacingAnalyzer(AnalyzerConfig config = AnalyzerConfig());

        RoadIndex build_index(const std::vector<Road>& roads) const;

        // One result per property, in input order. Throws NoRoadsIndexed
        // before touching any property when there is nothing to match against.
        std::vector<FacingResult> analyze(const std::vector<Property>& properties, const std::vector<Road>& roads) const;
        std::vector<FacingResult> analyze(const std::vector<Property>& properties, const RoadIndex& index) const;

        FacingResult resolve_property(const Property& property, const RoadIndex& index) const;

        const AnalyzerConfig& config() const;

    private:
        AnalyzerConfig _config;

        FacingResult resolve_property(const Property& property, const NearestRoadMatcher& matcher, const FacingResolver& resolver) const;
        double reported_distance(const LatLon& from, const LatLon& to) const;
};

std::vector<FacingResult> analyze(const std::vector<Property>& properties, const std::vector<Road>& roads, const AnalyzerConfig& config);
