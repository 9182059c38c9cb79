#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <boost/serialization/access.hpp>

static constexpr double R = 6378137.0;

struct LatLon {
public:
    double lat;
    double lon;

    LatLon();
    LatLon(double lat, double lon);
};

// Web mercator coordinate in meters, x east and y north.
struct Point {
public:
    double x;
    double y;

    Point();
    Point(double x, double y);

    double& operator[](size_t idx);
    const double& operator[](size_t idx) const;

    bool operator==(const Point& other) const;

    double euclidean_distance(const Point& other) const;

    static Point project_mercator(double lat, double lon);
    static Point project_mercator(const LatLon& location);
    LatLon unproject_mercator() const;

private:
    friend class boost::serialization::access;
    template<class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & x;
        ar & y;
    }
};

struct Property {
public:
    std::string pid;
    std::string address;
    LatLon location;

    Property();
    Property(std::string pid, std::string address, LatLon location);
};

struct Road {
public:
    std::string id;
    std::vector<LatLon> points;

    Road();
    Road(std::string id, std::vector<LatLon> points);
};

// Single straight piece of a road polyline, already projected.
struct Segment {
public:
    Point a;
    Point b;
    size_t road_idx;
    size_t ordinal;

    Segment();
    Segment(Point a, Point b, size_t road_idx, size_t ordinal);

    Point midpoint() const;
    bool is_degenerate() const;

private:
    friend class boost::serialization::access;
    template<class Archive>
    void serialize(Archive& ar, const unsigned int /*version*/) {
        ar & a;
        ar & b;
        ar & road_idx;
        ar & ordinal;
    }
};
