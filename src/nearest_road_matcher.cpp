#include "nearest_road_matcher.hpp"

NearestRoadMatcher::NearestRoadMatcher(const RoadIndex& index) : _index(index) { }

SegmentMatch NearestRoadMatcher::match(const Property& property) const {
    return match(Point::project_mercator(property.location));
}

SegmentMatch NearestRoadMatcher::match(const Point& location) const {
    return _index.nearest_segment(location);
}
