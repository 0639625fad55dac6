#pragma once

#include "geokit/error.hpp"
#include "geokit/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace geokit {

    // {"type": <kind>, "coordinates": [...]} or, for collections,
    // {"type": "GeometryCollection", "geometries": [...]}.
    boost::json::value geometryToJson(Geometry const &geom);

    // Resolves the "type" tag through GeometryRegistry and decodes the node.
    // Throws geokit::Error; `path` prefixes every reported location.
    Geometry geometryFromJson(boost::json::value const &node, std::string const &path = "$");

    std::string encode(Geometry const &geom);

    Geometry decodeGeometry(std::string_view text);

    // Deepest array/object nesting accepted from JSON text. A nested
    // GeometryCollection costs two levels, a FeatureCollection wrapper four.
    inline constexpr std::size_t kMaxNestingDepth = 512;

    namespace detail {
        // Integral doubles below 2^53 are stored as integers so that they
        // serialize without exponent or fraction.
        boost::json::value number_to_json(double v);

        boost::json::array sequence_to_json(CoordinateSequence const &seq);

        // Parses JSON text, reporting syntax errors as Errc::MalformedJSON.
        boost::json::value parse_text(std::string_view text);

        // Checks that `node` is an array nested exactly `depth` levels deep
        // with 2- or 3-number tuples at the bottom.
        void check_shape(boost::json::value const &node, int depth, std::string const &path);

        // Per-tag decode routines registered in GeometryRegistry. `node` is the
        // whole geometry object, tag included.
        Geometry decode_point(boost::json::object const &node, std::string const &path);
        Geometry decode_line_string(boost::json::object const &node, std::string const &path);
        Geometry decode_polygon(boost::json::object const &node, std::string const &path);
        Geometry decode_multi_point(boost::json::object const &node, std::string const &path);
        Geometry decode_multi_line_string(boost::json::object const &node, std::string const &path);
        Geometry decode_multi_polygon(boost::json::object const &node, std::string const &path);
        Geometry decode_geometry_collection(boost::json::object const &node, std::string const &path);
    } // namespace detail

} // namespace geokit
