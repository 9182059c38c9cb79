#include "facing_resolver.hpp"

#include <cmath>

const char* facing_status_name(FacingStatus status) {
    switch (status) {
        case FacingStatus::Resolved: return "ok";
        case FacingStatus::DegenerateSegment: return "degenerate_segment";
        case FacingStatus::AmbiguousResolution: return "ambiguous";
        case FacingStatus::NoRoadFound: return "no_road";
    }
    return "unknown";
}

FacingResolver::FacingResolver(CompassResolution resolution) : _resolution(resolution) { }

Facing FacingResolver::resolve(const Property& property, const SegmentMatch& match) const {
    return resolve(Point::project_mercator(property.location), match);
}

Facing FacingResolver::resolve(const Point& property_point, const SegmentMatch& match) const {
    const bool on_road = match.distance < ON_ROAD_EPSILON;

    if (match.segment.is_degenerate()) {
        // No road direction, so the house is taken to face the road point itself
        double toward_road = on_road ? 0.0 : bearing(property_point, match.closest);
        return make_facing(toward_road, FacingStatus::DegenerateSegment);
    }

    const double road_bearing = bearing(match.segment.a, match.segment.b);
    const double left = normalize_bearing(road_bearing - 90.0);
    const double right = normalize_bearing(road_bearing + 90.0);

    if (on_road) {
        return make_facing(right, FacingStatus::AmbiguousResolution);
    }

    const double toward_property = bearing(match.closest, property_point);
    const double right_diff = angular_difference(right, toward_property);
    const double left_diff = angular_difference(left, toward_property);

    // Property on the road's own axis past a segment end, neither side is closer
    if (std::fabs(right_diff - left_diff) <= FACING_TIE_EPSILON) {
        return make_facing(right, FacingStatus::AmbiguousResolution);
    }
    if (right_diff < left_diff) {
        return make_facing(right, FacingStatus::Resolved);
    }
    return make_facing(left, FacingStatus::Resolved);
}

Facing FacingResolver::make_facing(double bearing, FacingStatus status) const {
    return Facing{bearing, quantize_to_compass(bearing, _resolution), status};
}
