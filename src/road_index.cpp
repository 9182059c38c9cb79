#include "road_index.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>

#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/binary_iarchive.hpp>

#include "geometry.hpp"

RoadIndex::RoadIndex(double tie_break_tolerance) : _tie_break_tolerance(tie_break_tolerance) { }

void RoadIndex::build(const std::vector<Road>& roads) {
    _segments.clear();
    _road_ids.clear();
    _nodes.clear();

    _road_ids.reserve(roads.size());
    for (size_t r = 0; r < roads.size(); r++) {
        const Road& road = roads[r];
        _road_ids.push_back(road.id);
        if (road.points.size() < 2) continue;

        std::vector<Point> projected;
        projected.reserve(road.points.size());
        for (const auto& p : road.points) {
            projected.push_back(Point::project_mercator(p));
        }

        // Zero length pieces from repeated vertices are skipped. A road that
        // collapses to a single point is kept as one degenerate segment.
        bool added = false;
        for (size_t i = 0; i + 1 < projected.size(); i++) {
            if (projected[i] == projected[i + 1]) continue;
            _segments.emplace_back(projected[i], projected[i + 1], r, _segments.size());
            added = true;
        }
        if (!added) {
            _segments.emplace_back(projected[0], projected[0], r, _segments.size());
        }
    }

    build_tree();
}

void RoadIndex::build_tree() {
    _nodes.reserve(_segments.size());

    std::vector<std::pair<Point, size_t>> points;
    points.reserve(_segments.size());
    for (const auto& segment : _segments) {
        points.emplace_back(segment.midpoint(), segment.ordinal);
    }

    struct Task {
        size_t start;
        size_t end;
        size_t depth;
        size_t parent;
        bool is_left;
    };

    std::vector<Task> stack;
    stack.push_back({0, points.size(), 0, NONE, false});

    while (!stack.empty()) {
        auto task = stack.back();
        stack.pop_back();
        if (task.start >= task.end) continue;

        size_t mid = task.start + (task.end - task.start) / 2;
        uint8_t axis = static_cast<uint8_t>(task.depth % 2);

        std::nth_element(
            points.begin() + task.start, points.begin() + mid, points.begin() + task.end,
            [axis](auto& a, auto& b) { return a.first[axis] < b.first[axis]; }
        );

        const Segment& segment = _segments[points[mid].second];
        Point bl(std::min(segment.a.x, segment.b.x), std::min(segment.a.y, segment.b.y));
        Point tr(std::max(segment.a.x, segment.b.x), std::max(segment.a.y, segment.b.y));

        size_t node_idx = _nodes.size();
        _nodes.emplace_back(segment.ordinal, NONE, NONE, axis, bl, tr);

        if (task.parent != NONE) {
            if (task.is_left) _nodes[task.parent].left = node_idx;
            else _nodes[task.parent].right = node_idx;
        }

        stack.push_back({mid + 1, task.end, task.depth + 1, node_idx, false});
        stack.push_back({task.start, mid, task.depth + 1, node_idx, true});
    }

    compute_bboxes();
}

void RoadIndex::compute_bboxes() {
    if (_nodes.empty()) return;

    std::vector<size_t> order;
    order.reserve(_nodes.size());

    std::array<std::pair<size_t, bool>, 128> stack;
    int top = 0;
    stack[top++] = {0, false};

    while (top > 0) {
        auto [idx, visited] = stack[--top];
        if (visited) {
            order.push_back(idx);
            continue;
        }
        stack[top++] = {idx, true};
        if (_nodes[idx].right != NONE) stack[top++] = {_nodes[idx].right, false};
        if (_nodes[idx].left  != NONE) stack[top++] = {_nodes[idx].left, false};
    }

    for (size_t idx : order) {
        Node& n = _nodes[idx];
        for (size_t child : {n.left, n.right}) {
            if (child == NONE) continue;
            const Node& c = _nodes[child];
            n.bl.x = std::min(n.bl.x, c.bl.x);
            n.bl.y = std::min(n.bl.y, c.bl.y);
            n.tr.x = std::max(n.tr.x, c.tr.x);
            n.tr.y = std::max(n.tr.y, c.tr.y);
        }
    }
}

double RoadIndex::margin(double a, double b) const {
    return _tie_break_tolerance * std::max({1.0, a, b});
}

SegmentMatch RoadIndex::nearest_segment(const Point& target) const {
    if (_nodes.empty()) throw NoRoadsIndexed();

    size_t best_segment = NONE;
    SegmentProjection best{Point(), 0.0, std::numeric_limits<double>::max()};

    std::array<size_t, 128> stack;
    size_t top = 0;
    stack[top++] = 0;

    while (top > 0) {
        const Node& node = _nodes[stack[--top]];

        // The bound may have tightened since this node was pushed
        if (best_segment != NONE) {
            double box_distance = std::sqrt(distance_to_box_squared(target, node.bl, node.tr));
            if (box_distance > best.distance + margin(box_distance, best.distance)) continue;
        }

        const Segment& segment = _segments[node.segment];
        SegmentProjection candidate = closest_point_on_segment(target, segment.a, segment.b);

        bool better = false;
        if (best_segment == NONE) {
            better = true;
        } else {
            double m = margin(candidate.distance, best.distance);
            if (candidate.distance < best.distance - m) better = true;
            else if (std::fabs(candidate.distance - best.distance) <= m && segment.ordinal < best_segment) better = true;
        }
        if (better) {
            best = candidate;
            best_segment = segment.ordinal;
        }

        double diff = target[node.axis] - segment.midpoint()[node.axis];
        size_t near = diff < 0 ? node.left : node.right;
        size_t far  = diff < 0 ? node.right : node.left;

        // Far side first so the near side is popped next
        if (far != NONE) stack[top++] = far;
        if (near != NONE) stack[top++] = near;
    }

    const Segment& segment = _segments[best_segment];
    return SegmentMatch{segment.road_idx, _road_ids[segment.road_idx], segment, best.point, best.t, best.distance};
}

size_t RoadIndex::num_segments() const {
    return _segments.size();
}

size_t RoadIndex::num_roads() const {
    return _road_ids.size();
}

bool RoadIndex::empty() const {
    return _segments.empty();
}

const std::string& RoadIndex::road_id(size_t road_idx) const {
    return _road_ids.at(road_idx);
}

double RoadIndex::tie_break_tolerance() const {
    return _tie_break_tolerance;
}

void RoadIndex::save(const std::string& path) const {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.is_open()) {
        throw std::runtime_error("Cannot open index file for writing: " + path);
    }
    boost::archive::binary_oarchive oa(ofs);
    oa << *this;
}

RoadIndex RoadIndex::load(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open index file " + path);
    }

    RoadIndex index;
    boost::archive::binary_iarchive ia(ifs);
    ia >> index;
    return index;
}
