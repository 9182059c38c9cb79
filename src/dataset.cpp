#include "idataset.hpp"

#include <utility>

void Dataset::add_property(std::string pid, std::string address, LatLon location) {
    _properties.emplace_back(std::move(pid), std::move(address), location);
}

void Dataset::add_road(std::string id, std::vector<LatLon> points) {
    // Roads need a direction, a single vertex has none
    if (points.size() < 2) return;
    _roads.emplace_back(std::move(id), std::move(points));
}

size_t Dataset::num_properties() const {
    return _properties.size();
}

size_t Dataset::num_roads() const {
    return _roads.size();
}

const std::vector<Property>& Dataset::properties() const {
    return _properties;
}

const std::vector<Road>& Dataset::roads() const {
    return _roads;
}

void Dataset::set_properties(std::vector<Property> properties) {
    _properties = std::move(properties);
}
