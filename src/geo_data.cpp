#include "geo_data.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

LatLon::LatLon() : lat(0), lon(0) { }

LatLon::LatLon(double lat_, double lon_) : lat(lat_), lon(lon_) { }

Point::Point() : x(0), y(0) { }

Point::Point(double x_, double y_) : x(x_), y(y_) { }

double& Point::operator[](size_t idx) {
    if (idx == 0) return x;
    else if (idx == 1) return y;
    else throw std::out_of_range("Point index out of range");
}

const double& Point::operator[](size_t idx) const {
    if (idx == 0) return x;
    else if (idx == 1) return y;
    else throw std::out_of_range("Point index out of range");
}

bool Point::operator==(const Point& other) const {
    return x == other.x && y == other.y;
}

double Point::euclidean_distance(const Point& other) const {
    return std::hypot(x - other.x, y - other.y);
}

Point Point::project_mercator(double lat, double lon) {
    double x = R * lon * M_PI / 180.0;

    double lat_rad = lat * M_PI / 180.0;
    constexpr double max_lat_rad = 1.48352986419518;
    if (lat_rad > max_lat_rad) lat_rad = max_lat_rad;
    if (lat_rad < -max_lat_rad) lat_rad = -max_lat_rad;

    double y = R * std::log(std::tan(M_PI / 4.0 + lat_rad / 2.0));
    return Point(x, y);
}

Point Point::project_mercator(const LatLon& location) {
    return project_mercator(location.lat, location.lon);
}

LatLon Point::unproject_mercator() const {
    double lon = x / R * 180.0 / M_PI;
    double lat = (2.0 * std::atan(std::exp(y / R)) - M_PI / 2.0) * 180.0 / M_PI;
    return LatLon(lat, lon);
}


Property::Property() : pid(), address(), location() { }

Property::Property(std::string pid, std::string address, LatLon location)
    : pid(std::move(pid)), address(std::move(address)), location(location) { }

Road::Road() : id(), points() { }

Road::Road(std::string id, std::vector<LatLon> points)
    : id(std::move(id)), points(std::move(points)) { }

Segment::Segment() : a(), b(), road_idx(0), ordinal(0) { }

Segment::Segment(Point a, Point b, size_t road_idx, size_t ordinal)
    : a(a), b(b), road_idx(road_idx), ordinal(ordinal) { }

Point Segment::midpoint() const {
    return Point((a.x + b.x) / 2.0, (a.y + b.y) / 2.0);
}

bool Segment::is_degenerate() const {
    return a == b;
}
