#include "osm_handler.hpp"

#include <utility>
#include <vector>

OSMHandler::OSMHandler(IDataset& dataset) : _dataset(dataset) { }

bool OSMHandler::is_building(const osmium::TagList& tags) {
    return tags["building"];
}

bool OSMHandler::is_road(const osmium::TagList& tags) {
    return tags["highway"];
}

const char* OSMHandler::get_street_name(const osmium::TagList& tags) {
    return tags["addr:street"];
}

std::optional<std::string> OSMHandler::get_address(const osmium::TagList& tags) {
    const char* street = get_street_name(tags);
    if (!street) return std::nullopt;

    std::string address(street);
    const char* house_number = tags.get_value_by_key("addr:housenumber");
    if (house_number) {
        address += " ";
        address += house_number;
    }
    return address;
}

void OSMHandler::node(const osmium::Node& node) {
    const osmium::TagList& tags = node.tags();
    if (!is_building(tags)) return;
    if (!node.location()) return;

    std::optional<std::string> address = get_address(tags);
    if (!address) return;

    _dataset.add_property("n" + std::to_string(node.id()), std::move(*address),
                          LatLon(node.location().lat(), node.location().lon()));
}

void OSMHandler::way(const osmium::Way& way) {
    const osmium::TagList& tags = way.tags();
    if (!is_road(tags)) return;

    std::vector<LatLon> points;
    for (const auto& node_ref : way.nodes()) {
        if (node_ref.location().valid()) {
            points.emplace_back(node_ref.location().lat(), node_ref.location().lon());
        }
    }

    _dataset.add_road(std::to_string(way.id()), std::move(points));
}

void OSMHandler::area(const osmium::Area& area) {
    const osmium::TagList& tags = area.tags();
    if (!is_building(tags)) return;

    std::optional<std::string> address = get_address(tags);
    if (!address) return;

    std::optional<LatLon> centroid = compute_centroid(area);
    if (!centroid) return;

    std::string pid = (area.from_way() ? "w" : "r") + std::to_string(area.orig_id());
    _dataset.add_property(std::move(pid), std::move(*address), *centroid);
}

std::optional<LatLon> OSMHandler::compute_centroid(const osmium::Area& area) {
    double sum_lat = 0.0, sum_lon = 0.0;
    size_t count = 0;
    for (const auto& ring : area.outer_rings()) {
        for (size_t i = 0; i < ring.size(); ++i) {
            if (!ring[i].location().valid()) continue;
            sum_lat += ring[i].lat();
            sum_lon += ring[i].lon();
            ++count;
        }
    }
    if (count == 0) return std::nullopt;

    return LatLon(sum_lat / count, sum_lon / count);
}
