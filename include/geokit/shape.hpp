#pragma once

#include "geokit/types.hpp"

#include <array>
#include <cstddef>
#include <string_view>

namespace geokit {

    // One row per geometry kind: the GeoJSON tag and the nesting depth of its
    // "coordinates" array (1 = [x,y], 2 = [[x,y],...], ...). GeometryCollection
    // carries "geometries" instead and has depth 0.
    struct ShapeRule {
        GeometryKind kind;
        std::string_view tag;
        int depth;
    };

    inline constexpr std::array<ShapeRule, 7> kShapeTable = {{
        {GeometryKind::Point, "Point", 1},
        {GeometryKind::LineString, "LineString", 2},
        {GeometryKind::Polygon, "Polygon", 3},
        {GeometryKind::MultiPoint, "MultiPoint", 2},
        {GeometryKind::MultiLineString, "MultiLineString", 3},
        {GeometryKind::MultiPolygon, "MultiPolygon", 4},
        {GeometryKind::GeometryCollection, "GeometryCollection", 0},
    }};

    // Extra tags accepted on decode only.
    struct TagAlias {
        std::string_view tag;
        GeometryKind kind;
    };

    inline constexpr std::array<TagAlias, 1> kTagAliases = {{
        {"LinearRing", GeometryKind::LineString},
    }};

    inline constexpr std::size_t kMinTupleArity = 2;
    inline constexpr std::size_t kMaxTupleArity = 3;

    const ShapeRule &shapeRule(GeometryKind kind);

    const char *kindName(GeometryKind kind);

} // namespace geokit
