#pragma once

#include "geo_data.hpp"
#include "road_index.hpp"

class NearestRoadMatcher {
    public:
        explicit NearestRoadMatcher(const RoadIndex& index);

        // Throws NoRoadsIndexed when the index holds no segments.
        SegmentMatch match(const Property& property) const;
        SegmentMatch match(const Point& location) const;

    private:
        const RoadIndex& _index;
};
