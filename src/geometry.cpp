#include "geometry.hpp"

#include <algorithm>
#include <array>
#include <cmath>

static constexpr std::array<const char*, 16> COMPASS_LABELS = {
    "N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
    "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"
};

SegmentProjection closest_point_on_segment(const Point& p, const Point& a, const Point& b) {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double length_squared = dx * dx + dy * dy;

    if (length_squared == 0.0) {
        return SegmentProjection{a, 0.0, p.euclidean_distance(a)};
    }

    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / length_squared;
    t = std::clamp(t, 0.0, 1.0);

    Point closest;
    if (t == 0.0) closest = a;
    else if (t == 1.0) closest = b;
    else closest = Point(a.x + t * dx, a.y + t * dy);

    return SegmentProjection{closest, t, p.euclidean_distance(closest)};
}

double distance_to_box_squared(const Point& p, const Point& bl, const Point& tr) {
    double dx = 0.0;
    if (p.x < bl.x) dx = bl.x - p.x;
    else if (p.x > tr.x) dx = p.x - tr.x;

    double dy = 0.0;
    if (p.y < bl.y) dy = bl.y - p.y;
    else if (p.y > tr.y) dy = p.y - tr.y;

    return dx * dx + dy * dy;
}

double bearing(const Point& from, const Point& to) {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;
    return normalize_bearing(std::atan2(dx, dy) * 180.0 / M_PI);
}

double normalize_bearing(double degrees) {
    double result = std::fmod(degrees, 360.0);
    if (result < 0.0) result += 360.0;
    // fmod of a tiny negative value can round up to exactly 360
    if (result >= 360.0) result = 0.0;
    return result;
}

double angular_difference(double a, double b) {
    double diff = std::fmod(std::fabs(a - b), 360.0);
    if (diff > 180.0) diff = 360.0 - diff;
    return diff;
}

std::string quantize_to_compass(double degrees, CompassResolution resolution) {
    const size_t sectors = static_cast<size_t>(resolution);
    const double width = 360.0 / static_cast<double>(sectors);
    const double b = normalize_bearing(degrees);

    // ceil(x - 0.5) rounds halves down, i.e. counter-clockwise
    long idx = static_cast<long>(std::ceil(b / width - 0.5));
    idx %= static_cast<long>(sectors);

    const size_t step = COMPASS_LABELS.size() / sectors;
    return COMPASS_LABELS[static_cast<size_t>(idx) * step];
}

bool is_valid_coordinate(double lat, double lon) {
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

double haversine_distance(const LatLon& a, const LatLon& b) {
    const double lat1 = a.lat * M_PI / 180.0;
    const double lat2 = b.lat * M_PI / 180.0;
    const double dlat = lat2 - lat1;
    const double dlon = (b.lon - a.lon) * M_PI / 180.0;

    const double h = std::sin(dlat / 2.0) * std::sin(dlat / 2.0) +
                     std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2.0) * std::sin(dlon / 2.0);
    return 2.0 * EARTH_MEAN_RADIUS * std::asin(std::min(1.0, std::sqrt(h)));
}
