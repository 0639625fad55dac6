#pragma once

#include <datapod/datapod.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace geokit {

    enum class GeometryKind {
        Point,
        LineString,
        Polygon,
        MultiPoint,
        MultiLineString,
        MultiPolygon,
        GeometryCollection
    };

    // Ordered coordinate tuples sharing one dimension (2 = x,y or 3 = x,y,z).
    // For 2D sequences the z member of every tuple is ignored and kept at 0.
    class CoordinateSequence {
      public:
        CoordinateSequence() = default;
        CoordinateSequence(std::vector<dp::Point> points, std::size_t dimension = 2);
        CoordinateSequence(std::initializer_list<std::pair<double, double>> xy);

        std::size_t size() const { return points_.size(); }
        bool empty() const { return points_.empty(); }
        std::size_t dimension() const { return dimension_; }

        const dp::Point &at(std::size_t index) const;

        auto begin() const { return points_.cbegin(); }
        auto end() const { return points_.cend(); }

        friend bool operator==(const CoordinateSequence &a, const CoordinateSequence &b);
        friend bool operator!=(const CoordinateSequence &a, const CoordinateSequence &b) { return !(a == b); }

      private:
        std::vector<dp::Point> points_;
        std::size_t dimension_ = 2;
    };

    struct Point {
        CoordinateSequence coordinates; // empty or exactly one tuple

        Point() = default;
        Point(double x, double y);
        Point(double x, double y, double z);
        explicit Point(CoordinateSequence seq);

        bool empty() const { return coordinates.empty(); }
        double x() const { return coordinates.at(0).x; }
        double y() const { return coordinates.at(0).y; }
    };

    struct LineString {
        CoordinateSequence coordinates;
    };

    struct Polygon {
        CoordinateSequence shell;
        std::vector<CoordinateSequence> holes;

        bool empty() const { return shell.empty() && holes.empty(); }
    };

    struct MultiPoint {
        CoordinateSequence coordinates;
    };

    struct MultiLineString {
        std::vector<LineString> lines;
    };

    struct MultiPolygon {
        std::vector<Polygon> polygons;
    };

    class Geometry;

    struct GeometryCollection {
        std::vector<Geometry> geometries;

        std::size_t size() const;
        const Geometry &at(std::size_t index) const;
    };

    using Shape = std::variant<Point, LineString, Polygon, MultiPoint, MultiLineString, MultiPolygon,
                               GeometryCollection>;

    // Tagged geometry value. Implicitly constructible from any of the seven kinds.
    class Geometry {
      public:
        Geometry() = default;

        template <typename T,
                  typename = std::enable_if_t<std::conjunction_v<
                      std::negation<std::is_same<std::decay_t<T>, Geometry>>, std::is_constructible<Shape, T &&>>>>
        Geometry(T &&shape) : shape_(std::forward<T>(shape)) {}

        GeometryKind kind() const { return static_cast<GeometryKind>(shape_.index()); }

        const Shape &shape() const { return shape_; }

        template <typename T> bool is() const { return std::holds_alternative<T>(shape_); }
        template <typename T> const T &as() const { return std::get<T>(shape_); }
        template <typename T> const T *get_if() const { return std::get_if<T>(&shape_); }

      private:
        Shape shape_;
    };

    inline std::size_t GeometryCollection::size() const { return geometries.size(); }

    inline const Geometry &GeometryCollection::at(std::size_t index) const { return geometries.at(index); }

    bool operator==(const Point &a, const Point &b);
    bool operator==(const LineString &a, const LineString &b);
    bool operator==(const Polygon &a, const Polygon &b);
    bool operator==(const MultiPoint &a, const MultiPoint &b);
    bool operator==(const MultiLineString &a, const MultiLineString &b);
    bool operator==(const MultiPolygon &a, const MultiPolygon &b);
    bool operator==(const GeometryCollection &a, const GeometryCollection &b);
    bool operator==(const Geometry &a, const Geometry &b);

    inline bool operator!=(const Point &a, const Point &b) { return !(a == b); }
    inline bool operator!=(const LineString &a, const LineString &b) { return !(a == b); }
    inline bool operator!=(const Polygon &a, const Polygon &b) { return !(a == b); }
    inline bool operator!=(const MultiPoint &a, const MultiPoint &b) { return !(a == b); }
    inline bool operator!=(const MultiLineString &a, const MultiLineString &b) { return !(a == b); }
    inline bool operator!=(const MultiPolygon &a, const MultiPolygon &b) { return !(a == b); }
    inline bool operator!=(const GeometryCollection &a, const GeometryCollection &b) { return !(a == b); }
    inline bool operator!=(const Geometry &a, const Geometry &b) { return !(a == b); }

    template <typename T> constexpr GeometryKind kindOf() {
        if constexpr (std::is_same_v<T, Point>)
            return GeometryKind::Point;
        else if constexpr (std::is_same_v<T, LineString>)
            return GeometryKind::LineString;
        else if constexpr (std::is_same_v<T, Polygon>)
            return GeometryKind::Polygon;
        else if constexpr (std::is_same_v<T, MultiPoint>)
            return GeometryKind::MultiPoint;
        else if constexpr (std::is_same_v<T, MultiLineString>)
            return GeometryKind::MultiLineString;
        else if constexpr (std::is_same_v<T, MultiPolygon>)
            return GeometryKind::MultiPolygon;
        else {
            static_assert(std::is_same_v<T, GeometryCollection>, "not a geometry kind");
            return GeometryKind::GeometryCollection;
        }
    }

    // Geometry itself or one of the seven kind structs.
    template <typename T>
    inline constexpr bool is_geometry_v =
        std::is_same_v<T, Geometry> || std::is_same_v<T, Point> || std::is_same_v<T, LineString> ||
        std::is_same_v<T, Polygon> || std::is_same_v<T, MultiPoint> || std::is_same_v<T, MultiLineString> ||
        std::is_same_v<T, MultiPolygon> || std::is_same_v<T, GeometryCollection>;

    // Feature identifiers are either strings or integers.
    using FeatureId = std::variant<std::string, std::int64_t>;

} // namespace geokit
