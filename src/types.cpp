#include "geokit/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace geokit {

    namespace {
        bool same_tuple(const dp::Point &a, const dp::Point &b, std::size_t dimension) {
            if (a.x != b.x || a.y != b.y)
                return false;
            return dimension < 3 || a.z == b.z;
        }
    } // namespace

    CoordinateSequence::CoordinateSequence(std::vector<dp::Point> points, std::size_t dimension)
        : points_(std::move(points)), dimension_(dimension) {
        if (dimension_ != 2 && dimension_ != 3) {
            throw std::invalid_argument("geokit::CoordinateSequence: dimension must be 2 or 3, got " +
                                        std::to_string(dimension_));
        }
        // Without tuples there is nothing to carry a z ordinate; GeoJSON writes "[]" either way.
        if (points_.empty())
            dimension_ = 2;
        if (dimension_ == 2) {
            for (auto &p : points_)
                p.z = 0.0;
        }
    }

    CoordinateSequence::CoordinateSequence(std::initializer_list<std::pair<double, double>> xy) {
        points_.reserve(xy.size());
        for (auto const &[x, y] : xy)
            points_.push_back(dp::Point{x, y, 0.0});
    }

    const dp::Point &CoordinateSequence::at(std::size_t index) const {
        if (index >= points_.size()) {
            throw std::out_of_range("geokit::CoordinateSequence::at(): index " + std::to_string(index) +
                                    " out of range for size " + std::to_string(points_.size()));
        }
        return points_[index];
    }

    bool operator==(const CoordinateSequence &a, const CoordinateSequence &b) {
        if (a.dimension_ != b.dimension_ || a.points_.size() != b.points_.size())
            return false;
        for (std::size_t i = 0; i < a.points_.size(); ++i) {
            if (!same_tuple(a.points_[i], b.points_[i], a.dimension_))
                return false;
        }
        return true;
    }

    Point::Point(double x, double y) : coordinates({dp::Point{x, y, 0.0}}, 2) {}

    Point::Point(double x, double y, double z) : coordinates({dp::Point{x, y, z}}, 3) {}

    Point::Point(CoordinateSequence seq) : coordinates(std::move(seq)) {
        if (coordinates.size() > 1) {
            throw std::invalid_argument("geokit::Point: expected at most one coordinate, got " +
                                        std::to_string(coordinates.size()));
        }
    }

    bool operator==(const Point &a, const Point &b) { return a.coordinates == b.coordinates; }

    bool operator==(const LineString &a, const LineString &b) { return a.coordinates == b.coordinates; }

    bool operator==(const Polygon &a, const Polygon &b) { return a.shell == b.shell && a.holes == b.holes; }

    bool operator==(const MultiPoint &a, const MultiPoint &b) { return a.coordinates == b.coordinates; }

    bool operator==(const MultiLineString &a, const MultiLineString &b) { return a.lines == b.lines; }

    bool operator==(const MultiPolygon &a, const MultiPolygon &b) { return a.polygons == b.polygons; }

    bool operator==(const GeometryCollection &a, const GeometryCollection &b) {
        return std::equal(a.geometries.begin(), a.geometries.end(), b.geometries.begin(), b.geometries.end());
    }

    bool operator==(const Geometry &a, const Geometry &b) {
        if (a.kind() != b.kind())
            return false;
        return std::visit(
            [&](auto const &lhs) -> bool {
                using T = std::decay_t<decltype(lhs)>;
                return lhs == b.as<T>();
            },
            a.shape());
    }

} // namespace geokit
