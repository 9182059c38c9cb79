#pragma once

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/serialization/vector.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/access.hpp>

#include "geo_data.hpp"

static constexpr double DEFAULT_TIE_BREAK_TOLERANCE = 1e-9;

class NoRoadsIndexed : public std::runtime_error {
    public:
        NoRoadsIndexed() : std::runtime_error("No roads indexed: the road collection is empty") { }
};

struct SegmentMatch {
    size_t road_idx;
    std::string road_id;
    Segment segment;
    Point closest;
    double t;
    double distance;  // Planar, in projected meters
};

// KD-tree over road segments. Each node holds one segment, split on the
// segment midpoint, and the bounding box of every segment below it, so a
// nearest query can prune whole subtrees without missing long segments whose
// midpoint lies far away.
class RoadIndex {
    public:
        RoadIndex() = default;
        explicit RoadIndex(double tie_break_tolerance);

        void build(const std::vector<Road>& roads);

        // Globally nearest segment. Segments whose distances agree within the
        // tie break tolerance resolve to the one listed first in the road
        // collection.
        SegmentMatch nearest_segment(const Point& target) const;

        size_t num_segments() const;
        size_t num_roads() const;
        bool empty() const;

        const std::string& road_id(size_t road_idx) const;
        double tie_break_tolerance() const;

        void save(const std::string& path) const;
        static RoadIndex load(const std::string& path);

    private:
        static constexpr size_t NONE = std::numeric_limits<size_t>::max();

        struct Node {
            public:
                size_t segment;
                size_t left;
                size_t right;

                // Bounding box of the subtree
                Point bl;
                Point tr;

                uint8_t axis;

                Node() = default;
                Node(size_t segment, size_t left, size_t right, uint8_t axis, Point bl, Point tr)
                    : segment(segment), left(left), right(right), bl(bl), tr(tr), axis(axis) { }

            private:
                friend class boost::serialization::access;
                template<class Archive>
                void serialize(Archive& ar, const unsigned int /*version*/) {
                    ar & segment;
                    ar & left;
                    ar & right;
                    ar & bl;
                    ar & tr;
                    ar & axis;
                }
        };

        double _tie_break_tolerance = DEFAULT_TIE_BREAK_TOLERANCE;
        std::vector<Segment> _segments;
        std::vector<std::string> _road_ids;
        std::vector<Node> _nodes;

        void build_tree();
        void compute_bboxes();
        double margin(double a, double b) const;

        friend class boost::serialization::access;
        template<class Archive>
        void serialize(Archive& ar, const unsigned int /*version*/) {
            ar & _tie_break_tolerance;
            ar & _segments;
            ar & _road_ids;
            ar & _nodes;
        }
};
