#pragma once

#include <cstdint>
#include <string>

#include "geo_data.hpp"

static constexpr double EARTH_MEAN_RADIUS = 6371008.8;

enum class CompassResolution : uint8_t {
    Four = 4,
    Eight = 8,
    Sixteen = 16
};

struct SegmentProjection {
    Point point;
    double t;         // Clamped to [0, 1]
    double distance;
};

// Orthogonal projection of p onto the segment a-b. The projection parameter is
// clamped so the result never leaves the segment. A zero length segment
// projects everything onto a.
SegmentProjection closest_point_on_segment(const Point& p, const Point& a, const Point& b);

// Squared distance from p to the axis aligned box [bl, tr], zero inside.
double distance_to_box_squared(const Point& p, const Point& bl, const Point& tr);

// Bearing from one projected point to another in degrees, 0 = north, clockwise.
// Mercator is conformal, so this matches the true azimuth at street scale.
double bearing(const Point& from, const Point& to);

double normalize_bearing(double degrees);

// Smallest absolute difference between two bearings, in [0, 180].
double angular_difference(double a, double b);

// Maps a bearing onto the nearest compass sector. A bearing exactly between two
// sectors goes to the counter-clockwise one.
std::string quantize_to_compass(double degrees, CompassResolution resolution);

// True for a finite latitude in [-90, 90] and longitude in [-180, 180].
bool is_valid_coordinate(double lat, double lon);

// Great circle distance in meters.
double haversine_distance(const LatLon& a, const LatLon& b);
