#pragma once

#include <cstdint>
#include <string>

#include "geo_data.hpp"
#include "geometry.hpp"
#include "road_index.hpp"

// Below this planar distance a property counts as lying on the road.
static constexpr double ON_ROAD_EPSILON = 1e-6;

// Side candidates whose angular distances to the property differ by no more
// than this many degrees are treated as equally good.
static constexpr double FACING_TIE_EPSILON = 1e-6;

enum class FacingStatus : uint8_t {
    Resolved,
    DegenerateSegment,
    AmbiguousResolution,
    NoRoadFound
};

const char* facing_status_name(FacingStatus status);

struct Facing {
    double bearing;
    std::string label;
    FacingStatus status;
};

// Picks the perpendicular of the matched road that points from the road
// toward the property.
class FacingResolver {
    public:
        explicit FacingResolver(CompassResolution resolution = CompassResolution::Eight);

        Facing resolve(const Property& property, const SegmentMatch& match) const;
        Facing resolve(const Point& property_point, const SegmentMatch& match) const;

    private:
        CompassResolution _resolution;

        Facing make_facing(double bearing, FacingStatus status) const;
};
